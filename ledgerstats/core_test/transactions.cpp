#include <gtest/gtest.h>

#include <ledgerstats/lib/transactions.hpp>

#include <sstream>

TEST (transaction, parse)
{
	ledgerstats::error error;
	ledgerstats::transaction transaction (error, 3, "1 2 7");
	ASSERT_FALSE (error);
	ASSERT_EQ (3, transaction.id ().number ());
	ASSERT_TRUE (transaction.left ().is_root ());
	ASSERT_EQ (2, transaction.right ().number ());
	ASSERT_EQ (7, transaction.timestamp ());
}

TEST (transaction, parse_whitespace)
{
	ledgerstats::error error;
	ledgerstats::transaction transaction (error, 2, "\t1  1\t 0 trailing tokens\r");
	ASSERT_FALSE (error);
	ASSERT_TRUE (transaction.left ().is_root ());
	ASSERT_TRUE (transaction.right ().is_root ());
	ASSERT_EQ (0, transaction.timestamp ());
}

TEST (transaction, to_string)
{
	std::error_code ec;
	ledgerstats::transaction_id id (ec, 2);
	ASSERT_FALSE (ec);
	ledgerstats::transaction transaction (id, ledgerstats::identifier::root (), ledgerstats::identifier::root (), 0);
	ASSERT_EQ ("Tx<Tx:2, Root, Root, 0>", transaction.to_string ());
	std::ostringstream stream;
	stream << transaction;
	ASSERT_EQ (transaction.to_string (), stream.str ());
}

TEST (transaction, equality)
{
	ledgerstats::error error;
	ledgerstats::transaction transaction1 (error, 2, "1 1 5");
	ledgerstats::transaction transaction2 (error, 2, "1 1 5");
	ledgerstats::transaction transaction3 (error, 2, "1 1 6");
	ASSERT_FALSE (error);
	ASSERT_EQ (transaction1, transaction2);
	ASSERT_NE (transaction1, transaction3);
}

TEST (transaction, missing_fields)
{
	{
		ledgerstats::error error;
		ledgerstats::transaction transaction (error, 2, "");
		ASSERT_EQ (ledgerstats::error_transaction::missing_left, error.error_code ());
		ASSERT_EQ ("Missing left reference", error.get_message ());
	}
	{
		ledgerstats::error error;
		ledgerstats::transaction transaction (error, 2, "1");
		ASSERT_EQ (ledgerstats::error_transaction::missing_right, error.error_code ());
	}
	{
		ledgerstats::error error;
		ledgerstats::transaction transaction (error, 2, "1 1");
		ASSERT_EQ (ledgerstats::error_transaction::missing_timestamp, error.error_code ());
		ASSERT_EQ ("Missing timestamp", error.get_message ());
	}
}

TEST (transaction, invalid_fields)
{
	{
		ledgerstats::error error;
		ledgerstats::transaction transaction (error, 2, "a 1 0");
		ASSERT_EQ (ledgerstats::error_transaction::invalid_left, error.error_code ());
		ASSERT_EQ ("Invalid left reference: Invalid digit in number", error.get_message ());
	}
	{
		ledgerstats::error error;
		ledgerstats::transaction transaction (error, 2, "1 -2 0");
		ASSERT_EQ (ledgerstats::error_transaction::invalid_right, error.error_code ());
	}
	{
		ledgerstats::error error;
		ledgerstats::transaction transaction (error, 2, "1 1 3.5");
		ASSERT_EQ (ledgerstats::error_transaction::invalid_timestamp, error.error_code ());
		ASSERT_EQ ("Invalid timestamp: Invalid digit in number", error.get_message ());
	}
	{
		ledgerstats::error error;
		ledgerstats::transaction transaction (error, 2, "1 1 99999999999999999999");
		ASSERT_EQ (ledgerstats::error_transaction::invalid_timestamp, error.error_code ());
		ASSERT_EQ ("Invalid timestamp: Number too large", error.get_message ());
	}
}

TEST (transaction, invalid_reference_ids)
{
	{
		ledgerstats::error error;
		ledgerstats::transaction transaction (error, 2, "0 1 0");
		ASSERT_EQ (ledgerstats::error_transaction::invalid_left_id, error.error_code ());
		ASSERT_EQ ("Invalid left id: Invalid ID 0", error.get_message ());
	}
	{
		ledgerstats::error error;
		ledgerstats::transaction transaction (error, 2, "1 0 0");
		ASSERT_EQ (ledgerstats::error_transaction::invalid_right_id, error.error_code ());
		ASSERT_EQ ("Invalid right id: Invalid ID 0", error.get_message ());
	}
}

TEST (transaction, invalid_id)
{
	ledgerstats::error error;
	ledgerstats::transaction transaction (error, 1, "1 1 0");
	ASSERT_EQ (ledgerstats::error_transaction::invalid_id, error.error_code ());
	ASSERT_EQ ("Invalid Id: ID 1 is reserved for Root", error.get_message ());
}
