#include "ledgerstats/lib/errors.hpp"

std::string ledgerstats::error_common_messages::message (int ev) const
{
	switch (static_cast<ledgerstats::error_common> (ev))
	{
		case ledgerstats::error_common::generic:
			return "Unknown error";
		case ledgerstats::error_common::exception:
			return "Exception thrown";
		case ledgerstats::error_common::io:
			return "IO Error";
		case ledgerstats::error_common::numeric_conversion:
			return "Numeric conversion error";
	}

	return "Invalid error code";
}

std::string ledgerstats::error_number_messages::message (int ev) const
{
	switch (static_cast<ledgerstats::error_number> (ev))
	{
		case ledgerstats::error_number::generic:
			return "Unknown error";
		case ledgerstats::error_number::empty:
			return "Empty number";
		case ledgerstats::error_number::invalid_digit:
			return "Invalid digit in number";
		case ledgerstats::error_number::overflow:
			return "Number too large";
	}

	return "Invalid error code";
}

std::string ledgerstats::error_identifier_messages::message (int ev) const
{
	switch (static_cast<ledgerstats::error_identifier> (ev))
	{
		case ledgerstats::error_identifier::generic:
			return "Unknown error";
		case ledgerstats::error_identifier::invalid:
			return "Invalid ID 0";
		case ledgerstats::error_identifier::reserved:
			return "ID 1 is reserved for Root";
	}

	return "Invalid error code";
}

std::string ledgerstats::error_transaction_messages::message (int ev) const
{
	switch (static_cast<ledgerstats::error_transaction> (ev))
	{
		case ledgerstats::error_transaction::generic:
			return "Unknown error";
		case ledgerstats::error_transaction::invalid_id:
			return "Invalid Id";
		case ledgerstats::error_transaction::missing_left:
			return "Missing left reference";
		case ledgerstats::error_transaction::missing_right:
			return "Missing right reference";
		case ledgerstats::error_transaction::missing_timestamp:
			return "Missing timestamp";
		case ledgerstats::error_transaction::invalid_left:
			return "Invalid left reference";
		case ledgerstats::error_transaction::invalid_right:
			return "Invalid right reference";
		case ledgerstats::error_transaction::invalid_timestamp:
			return "Invalid timestamp";
		case ledgerstats::error_transaction::invalid_left_id:
			return "Invalid left id";
		case ledgerstats::error_transaction::invalid_right_id:
			return "Invalid right id";
	}

	return "Invalid error code";
}

std::string ledgerstats::error_graph_messages::message (int ev) const
{
	switch (static_cast<ledgerstats::error_graph> (ev))
	{
		case ledgerstats::error_graph::generic:
			return "Unknown error";
		case ledgerstats::error_graph::missing_count:
			return "Missing number of transactions";
		case ledgerstats::error_graph::invalid_count:
			return "Invalid number of transactions";
		case ledgerstats::error_graph::too_many_transactions:
			return "Too many transactions";
		case ledgerstats::error_graph::too_little_transactions:
			return "Too little transactions";
		case ledgerstats::error_graph::invalid_left_reference:
			return "Invalid left reference";
		case ledgerstats::error_graph::invalid_right_reference:
			return "Invalid right reference";
		case ledgerstats::error_graph::io:
			return "Error reading the graph";
	}

	return "Invalid error code";
}

std::string ledgerstats::error_validation_messages::message (int ev) const
{
	switch (static_cast<ledgerstats::error_validation> (ev))
	{
		case ledgerstats::error_validation::generic:
			return "Unknown error";
		case ledgerstats::error_validation::cyclic:
			return "Graph is connected but cyclic, this is not supported";
		case ledgerstats::error_validation::disconnected:
			return "Graph is unconnected, this is not supported";
		case ledgerstats::error_validation::not_bipartite:
			return "Graph is not bipartite";
	}

	return "Invalid error code";
}

std::string ledgerstats::error_config_messages::message (int ev) const
{
	switch (static_cast<ledgerstats::error_config> (ev))
	{
		case ledgerstats::error_config::generic:
			return "Unknown error";
		case ledgerstats::error_config::invalid_value:
			return "Invalid configuration value";
		case ledgerstats::error_config::missing_value:
			return "Missing value in configuration";
	}

	return "Invalid error code";
}
