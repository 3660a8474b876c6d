#include <gtest/gtest.h>

#include <ledgerstats/core_test/testutil.hpp>
#include <ledgerstats/secure/graph.hpp>

TEST (graph, empty)
{
	ledgerstats::graph graph;
	ASSERT_TRUE (graph.empty ());
	ASSERT_EQ (0, graph.size ());
	ASSERT_EQ (1, graph.max_identifier ());
	ASSERT_TRUE (graph.contains (ledgerstats::identifier::root ()));
	ASSERT_EQ (nullptr, graph.references (ledgerstats::identifier::root ()));
}

TEST (graph, read_example)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, ledgerstats::example_ledger));
	ASSERT_FALSE (error);
	ASSERT_EQ (5, graph.size ());
	ASSERT_EQ (6, graph.max_identifier ());
	std::error_code ec;
	ledgerstats::transaction_id two (ec, 2);
	ledgerstats::transaction_id five (ec, 5);
	ledgerstats::transaction_id six (ec, 6);
	ASSERT_FALSE (ec);
	ASSERT_EQ ("Tx<Tx:2, Root, Root, 0>", graph.get (two).to_string ());
	ASSERT_EQ ("Tx<Tx:5, Tx:3, Tx:6, 3>", graph.get (five).to_string ());
	ASSERT_TRUE (graph.contains (six));
	ASSERT_FALSE (graph.contains (ledgerstats::identifier (ec, 7)));
}

TEST (graph, reverse_index)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, ledgerstats::example_ledger));
	ASSERT_FALSE (error);
	std::error_code ec;
	ledgerstats::transaction_id two (ec, 2);
	ledgerstats::transaction_id three (ec, 3);
	ledgerstats::transaction_id four (ec, 4);
	ledgerstats::transaction_id six (ec, 6);
	auto root (graph.references (ledgerstats::identifier::root ()));
	ASSERT_NE (nullptr, root);
	// Tx:2 references Root twice
	ASSERT_EQ (3, root->count ());
	ASSERT_EQ (2, root->sources ().size ());
	ASSERT_EQ (1, root->sources ().count (two));
	ASSERT_EQ (1, root->sources ().count (three));
	auto references_two (graph.references (two));
	ASSERT_NE (nullptr, references_two);
	ASSERT_EQ (3, references_two->count ());
	ASSERT_EQ (1, references_two->sources ().count (three));
	ASSERT_EQ (1, references_two->sources ().count (four));
	auto references_six (graph.references (six));
	ASSERT_NE (nullptr, references_six);
	ASSERT_EQ (1, references_six->count ());
	ASSERT_EQ (nullptr, graph.references (four));
}

TEST (graph, equality)
{
	ledgerstats::error error;
	auto graph1 (ledgerstats::read_graph (error, ledgerstats::example_ledger));
	ASSERT_FALSE (error);
	auto graph2 (ledgerstats::make_graph ({ { 1, 1, 0 }, { 1, 2, 0 }, { 2, 2, 1 }, { 3, 6, 3 }, { 3, 3, 2 } }));
	ASSERT_TRUE (graph1 == graph2);
	auto graph3 (ledgerstats::make_graph ({ { 1, 1, 0 }, { 1, 2, 0 } }));
	ASSERT_TRUE (graph1 != graph3);
}

TEST (graph, no_transactions)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, "0\n"));
	ASSERT_FALSE (error);
	ASSERT_TRUE (graph.empty ());
}

TEST (graph, carriage_returns)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, "2\r\n1 1 0\r\n2 1 1\r\n"));
	ASSERT_FALSE (error);
	ASSERT_EQ (2, graph.size ());
}

TEST (graph, no_trailing_newline)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, "1\n1 1 4"));
	ASSERT_FALSE (error);
	ASSERT_EQ (1, graph.size ());
	ASSERT_EQ (4, graph.transactions ()[0].timestamp ());
}

TEST (graph, forward_reference)
{
	// References are bounded by the declared count rather than the position
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, "2\n1 3 0\n1 1 0\n"));
	ASSERT_FALSE (error);
	ASSERT_EQ (2, graph.size ());
}

TEST (graph, missing_count)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, ""));
	ASSERT_EQ (ledgerstats::error_graph::missing_count, error.error_code ());
	ASSERT_EQ ("Missing number of transactions", error.get_message ());
}

TEST (graph, invalid_count)
{
	{
		ledgerstats::error error;
		auto graph (ledgerstats::read_graph (error, "\n1 1 0\n"));
		ASSERT_EQ (ledgerstats::error_graph::invalid_count, error.error_code ());
		ASSERT_EQ ("Invalid number of transactions: Empty number", error.get_message ());
	}
	{
		ledgerstats::error error;
		auto graph (ledgerstats::read_graph (error, "five\n"));
		ASSERT_EQ (ledgerstats::error_graph::invalid_count, error.error_code ());
		ASSERT_EQ ("Invalid number of transactions: Invalid digit in number", error.get_message ());
	}
	{
		ledgerstats::error error;
		auto graph (ledgerstats::read_graph (error, "1 \n1 1 0\n"));
		ASSERT_EQ (ledgerstats::error_graph::invalid_count, error.error_code ());
	}
}

TEST (graph, too_many_transactions)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, "1\n1 1 0\n1 1 0\n"));
	ASSERT_EQ (ledgerstats::error_graph::too_many_transactions, error.error_code ());
	ASSERT_EQ ("Too many transactions", error.get_message ());
}

TEST (graph, too_little_transactions)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, "3\n1 1 0\n"));
	ASSERT_EQ (ledgerstats::error_graph::too_little_transactions, error.error_code ());
	ASSERT_EQ ("Too little transactions", error.get_message ());
}

TEST (graph, invalid_transaction)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, "2\n1 1 0\n1 a 0\n"));
	// The cause keeps its own code
	ASSERT_EQ (ledgerstats::error_transaction::invalid_right, error.error_code ());
	ASSERT_EQ ("Invalid transaction on line 3: Invalid right reference: Invalid digit in number", error.get_message ());
}

TEST (graph, missing_timestamp)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, "1\n1 1\n"));
	ASSERT_EQ (ledgerstats::error_transaction::missing_timestamp, error.error_code ());
	ASSERT_EQ ("Invalid transaction on line 2: Missing timestamp", error.get_message ());
}

TEST (graph, invalid_left_reference)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, "1\n3 1 0\n"));
	ASSERT_EQ (ledgerstats::error_graph::invalid_left_reference, error.error_code ());
	ASSERT_EQ ("Invalid left ref to Tx:3 on Tx:2 max=2", error.get_message ());
}

TEST (graph, invalid_right_reference)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, "2\n1 1 0\n2 4 1\n"));
	ASSERT_EQ (ledgerstats::error_graph::invalid_right_reference, error.error_code ());
	ASSERT_EQ ("Invalid right ref to Tx:4 on Tx:3 max=3", error.get_message ());
}

TEST (graph, io_error)
{
	{
		ledgerstats::failing_buffer buffer ("");
		std::istream stream (&buffer);
		ledgerstats::error error;
		ledgerstats::graph graph (error, stream);
		ASSERT_EQ (ledgerstats::error_graph::io, error.error_code ());
		ASSERT_EQ ("Error reading the graph", error.get_message ());
	}
	{
		ledgerstats::failing_buffer buffer ("2\n1 1 0\n");
		std::istream stream (&buffer);
		ledgerstats::error error;
		ledgerstats::graph graph (error, stream);
		ASSERT_EQ (ledgerstats::error_graph::io, error.error_code ());
		// Lines before the failure were kept
		ASSERT_EQ (1, graph.size ());
	}
}

TEST (graph, plus_sign)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, "+1\n1 +1 +4\n"));
	ASSERT_FALSE (error);
	ASSERT_EQ (1, graph.size ());
	ASSERT_EQ (4, graph.transactions ()[0].timestamp ());
}
