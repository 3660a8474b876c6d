#include <gtest/gtest.h>

#include <ledgerstats/lib/errors.hpp>
#include <ledgerstats/node/cli.hpp>

#include <stdexcept>

TEST (errors, categories)
{
	std::error_code graph (ledgerstats::error_graph::missing_count);
	ASSERT_STREQ ("error_graph", graph.category ().name ());
	ASSERT_EQ ("Missing number of transactions", graph.message ());
	std::error_code validation (ledgerstats::error_validation::disconnected);
	ASSERT_EQ ("Graph is unconnected, this is not supported", validation.message ());
	std::error_code cli (ledgerstats::error_cli::missing_input);
	ASSERT_STREQ ("error_cli", cli.category ().name ());
	// Same value, different categories
	ASSERT_NE (std::error_code (ledgerstats::error_graph::missing_count), std::error_code (ledgerstats::error_transaction::invalid_id));
	ASSERT_EQ ("Invalid error code", std::error_code (static_cast<ledgerstats::error_validation> (99)).message ());
}

TEST (errors, message)
{
	ledgerstats::error error;
	ASSERT_FALSE (error);
	ASSERT_EQ ("", error.get_message ());
	error = ledgerstats::error_common::numeric_conversion;
	ASSERT_TRUE (error);
	ASSERT_EQ ("Numeric conversion error", error.get_message ());
	error.set_message ("Count too large");
	ASSERT_EQ (ledgerstats::error_common::numeric_conversion, error.error_code ());
	ASSERT_EQ ("Count too large", static_cast<std::string> (error));
	error.clear ();
	ASSERT_FALSE (error);
	error.set_message ("Something failed");
	ASSERT_EQ (ledgerstats::error_common::generic, error.error_code ());
}

TEST (errors, wrap)
{
	ledgerstats::error error (ledgerstats::error_transaction::missing_timestamp);
	error.wrap ("Invalid transaction on line 4");
	ASSERT_EQ (ledgerstats::error_transaction::missing_timestamp, error.error_code ());
	ASSERT_EQ ("Invalid transaction on line 4: Missing timestamp", error.get_message ());
	ledgerstats::error none;
	none.wrap ("Context");
	ASSERT_FALSE (none);
	ASSERT_EQ ("", none.get_message ());
}

TEST (errors, exception)
{
	ledgerstats::error error (std::runtime_error ("boom"));
	ASSERT_EQ (ledgerstats::error_common::exception, error.error_code ());
	ASSERT_EQ ("boom", error.get_message ());
}

TEST (errors, on_error)
{
	ledgerstats::error error;
	error.on_error ("Not applied");
	ASSERT_FALSE (error);
	error = ledgerstats::error_graph::too_many_transactions;
	error.on_error (ledgerstats::error_graph::too_little_transactions, "Not applied");
	ASSERT_EQ ("Too many transactions", error.get_message ());
	error.on_error (ledgerstats::error_graph::too_many_transactions, "Applied");
	ASSERT_EQ ("Applied", error.get_message ());
}

TEST (errors, accept_then)
{
	ledgerstats::error error (ledgerstats::error_validation::not_bipartite);
	error.accept (ledgerstats::error_validation::not_bipartite);
	ASSERT_FALSE (error);
	auto called (false);
	ledgerstats::error next (ledgerstats::error_validation::cyclic);
	auto & result (error.then ([&called, &next]() -> ledgerstats::error & {
		called = true;
		return next;
	}));
	ASSERT_TRUE (called);
	ASSERT_EQ (ledgerstats::error_validation::cyclic, result.error_code ());
	called = false;
	next.then ([&called, &error]() -> ledgerstats::error & {
		called = true;
		return error;
	});
	ASSERT_FALSE (called);
}
