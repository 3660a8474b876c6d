#include <ledgerstats/lib/transactions.hpp>

#include <boost/format.hpp>
#include <boost/tokenizer.hpp>

namespace
{
using tokenizer = boost::tokenizer<boost::char_separator<char>>;

/** Decode the next reference token, reporting \p parse_error_a or \p id_error_a with the cause appended */
ledgerstats::identifier decode_reference (ledgerstats::error & error_a, std::string const & token_a, ledgerstats::error_transaction parse_error_a, ledgerstats::error_transaction id_error_a)
{
	ledgerstats::identifier result;
	uint64_t number (0);
	auto ec (ledgerstats::decode_dec (token_a, number));
	if (!ec)
	{
		ledgerstats::identifier reference (ec, number);
		if (!ec)
		{
			result = reference;
		}
		else
		{
			error_a = id_error_a;
			error_a.set_message (error_a.get_message () + ": " + ec.message ());
		}
	}
	else
	{
		error_a = parse_error_a;
		error_a.set_message (error_a.get_message () + ": " + ec.message ());
	}
	return result;
}
}

ledgerstats::transaction::transaction (ledgerstats::transaction_id const & id_a, ledgerstats::identifier const & left_a, ledgerstats::identifier const & right_a, uint64_t timestamp_a) :
id_m (id_a),
left_m (left_a),
right_m (right_a),
timestamp_m (timestamp_a)
{
}

ledgerstats::transaction::transaction (ledgerstats::error & error_a, uint64_t id_a, std::string const & line_a)
{
	std::error_code ec;
	ledgerstats::transaction_id id_l (ec, id_a);
	if (!ec)
	{
		id_m = id_l;
		boost::char_separator<char> separator (" \t\n\v\f\r");
		tokenizer tokens (line_a, separator);
		auto token (tokens.begin ());
		if (token != tokens.end ())
		{
			left_m = decode_reference (error_a, *token, ledgerstats::error_transaction::invalid_left, ledgerstats::error_transaction::invalid_left_id);
			++token;
		}
		else
		{
			error_a = ledgerstats::error_transaction::missing_left;
		}
		if (!error_a)
		{
			if (token != tokens.end ())
			{
				right_m = decode_reference (error_a, *token, ledgerstats::error_transaction::invalid_right, ledgerstats::error_transaction::invalid_right_id);
				++token;
			}
			else
			{
				error_a = ledgerstats::error_transaction::missing_right;
			}
		}
		if (!error_a)
		{
			if (token != tokens.end ())
			{
				auto timestamp_ec (ledgerstats::decode_dec (*token, timestamp_m));
				if (timestamp_ec)
				{
					error_a = ledgerstats::error_transaction::invalid_timestamp;
					error_a.set_message (error_a.get_message () + ": " + timestamp_ec.message ());
				}
			}
			else
			{
				error_a = ledgerstats::error_transaction::missing_timestamp;
			}
		}
	}
	else
	{
		error_a = ledgerstats::error_transaction::invalid_id;
		error_a.set_message (error_a.get_message () + ": " + ec.message ());
	}
}

ledgerstats::transaction_id ledgerstats::transaction::id () const
{
	return id_m;
}

ledgerstats::identifier ledgerstats::transaction::left () const
{
	return left_m;
}

ledgerstats::identifier ledgerstats::transaction::right () const
{
	return right_m;
}

uint64_t ledgerstats::transaction::timestamp () const
{
	return timestamp_m;
}

bool ledgerstats::transaction::operator== (ledgerstats::transaction const & other_a) const
{
	return id_m == other_a.id_m && left_m == other_a.left_m && right_m == other_a.right_m && timestamp_m == other_a.timestamp_m;
}

bool ledgerstats::transaction::operator!= (ledgerstats::transaction const & other_a) const
{
	return !(*this == other_a);
}

std::string ledgerstats::transaction::to_string () const
{
	return boost::str (boost::format ("Tx<%1%, %2%, %3%, %4%>") % ledgerstats::identifier (id_m) % left_m % right_m % timestamp_m);
}

std::ostream & ledgerstats::operator<< (std::ostream & stream_a, ledgerstats::transaction const & transaction_a)
{
	return stream_a << transaction_a.to_string ();
}
