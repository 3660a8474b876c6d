#include <gtest/gtest.h>

#include <ledgerstats/lib/numbers.hpp>

#include <limits>
#include <sstream>
#include <unordered_set>

TEST (number, decode_dec)
{
	uint64_t value (7);
	ASSERT_FALSE (ledgerstats::decode_dec ("0", value));
	ASSERT_EQ (0, value);
	ASSERT_FALSE (ledgerstats::decode_dec ("18446744073709551615", value));
	ASSERT_EQ (std::numeric_limits<uint64_t>::max (), value);
	ASSERT_FALSE (ledgerstats::decode_dec ("007", value));
	ASSERT_EQ (7, value);
	ASSERT_FALSE (ledgerstats::decode_dec ("+5", value));
	ASSERT_EQ (5, value);
}

TEST (number, decode_dec_failures)
{
	uint64_t value (42);
	ASSERT_EQ (ledgerstats::error_number::empty, ledgerstats::decode_dec ("", value));
	ASSERT_EQ (ledgerstats::error_number::invalid_digit, ledgerstats::decode_dec ("-1", value));
	ASSERT_EQ (ledgerstats::error_number::invalid_digit, ledgerstats::decode_dec ("1a", value));
	ASSERT_EQ (ledgerstats::error_number::invalid_digit, ledgerstats::decode_dec (" 1", value));
	ASSERT_EQ (ledgerstats::error_number::invalid_digit, ledgerstats::decode_dec ("+", value));
	ASSERT_EQ (ledgerstats::error_number::invalid_digit, ledgerstats::decode_dec ("++1", value));
	ASSERT_EQ (ledgerstats::error_number::invalid_digit, ledgerstats::decode_dec ("1+", value));
	ASSERT_EQ (ledgerstats::error_number::overflow, ledgerstats::decode_dec ("18446744073709551616", value));
	// Untouched on failure
	ASSERT_EQ (42, value);
}

TEST (number, to_double)
{
	double result (0.0);
	ASSERT_FALSE (ledgerstats::to_double (5, result));
	ASSERT_EQ (5.0, result);
	uint64_t const max_exact (uint64_t (1) << 53);
	ASSERT_FALSE (ledgerstats::to_double (max_exact, result));
	ASSERT_EQ (9007199254740992.0, result);
	ASSERT_EQ (ledgerstats::error_common::numeric_conversion, ledgerstats::to_double (max_exact + 1, result));
	ASSERT_EQ (ledgerstats::error_common::numeric_conversion, ledgerstats::to_double (std::numeric_limits<uint64_t>::max (), result));
}

TEST (identifier, root)
{
	ledgerstats::identifier root;
	ASSERT_TRUE (root.is_root ());
	ASSERT_EQ (ledgerstats::identifier::root (), root);
	ASSERT_EQ (1, root.number ());
	ASSERT_EQ ("Root", root.to_string ());
	std::error_code ec;
	ledgerstats::identifier decoded (ec, 1);
	ASSERT_FALSE (ec);
	ASSERT_TRUE (decoded.is_root ());
}

TEST (identifier, transaction)
{
	std::error_code ec;
	ledgerstats::identifier id (ec, 2);
	ASSERT_FALSE (ec);
	ASSERT_FALSE (id.is_root ());
	ASSERT_EQ (2, id.number ());
	ASSERT_EQ (2, id.transaction ().number ());
	ASSERT_EQ ("Tx:2", id.to_string ());
	ASSERT_EQ ("Id(2)", id.transaction ().to_string ());
	std::ostringstream stream;
	stream << id << ' ' << ledgerstats::identifier::root ();
	ASSERT_EQ ("Tx:2 Root", stream.str ());
}

TEST (identifier, invalid)
{
	std::error_code ec;
	ledgerstats::identifier id (ec, 0);
	ASSERT_EQ (ledgerstats::error_identifier::invalid, ec);
	ASSERT_EQ ("Invalid ID 0", ec.message ());
}

TEST (identifier, reserved)
{
	std::error_code ec;
	ledgerstats::transaction_id id (ec, 1);
	ASSERT_EQ (ledgerstats::error_identifier::reserved, ec);
	ASSERT_EQ ("ID 1 is reserved for Root", ec.message ());
	std::error_code ec2;
	ledgerstats::transaction_id zero (ec2, 0);
	ASSERT_EQ (ledgerstats::error_identifier::invalid, ec2);
}

TEST (identifier, ordering)
{
	std::error_code ec;
	ledgerstats::identifier two (ec, 2);
	ledgerstats::identifier three (ec, 3);
	ASSERT_FALSE (ec);
	ASSERT_LT (ledgerstats::identifier::root (), two);
	ASSERT_LT (two, three);
	ASSERT_NE (two, three);
	ASSERT_EQ (two, ledgerstats::identifier (two.transaction ()));
	std::unordered_set<ledgerstats::identifier> set{ two, three, ledgerstats::identifier::root (), two };
	ASSERT_EQ (3, set.size ());
}
