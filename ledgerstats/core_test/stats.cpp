#include <gtest/gtest.h>

#include <ledgerstats/core_test/testutil.hpp>
#include <ledgerstats/node/stats.hpp>

#include <sstream>

namespace
{
std::string run_stats (ledgerstats::graph const & graph_a)
{
	auto stats (ledgerstats::stat::make_default (graph_a));
	stats.collect ();
	std::ostringstream stream;
	auto error (stats.write (stream));
	EXPECT_FALSE (error);
	return stream.str ();
}

ledgerstats::transaction transaction (uint64_t number_a, uint64_t timestamp_a)
{
	std::error_code ec;
	ledgerstats::transaction_id id (ec, number_a);
	EXPECT_FALSE (ec);
	return ledgerstats::transaction (id, ledgerstats::identifier::root (), ledgerstats::identifier::root (), timestamp_a);
}
}

TEST (stats, example)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, ledgerstats::example_ledger));
	ASSERT_FALSE (error);
	ASSERT_EQ ("> AVG DAG DEPTH: 1.33\n"
	           "> AVG TXS PER DEPTH: 2.50\n"
	           "> AVG REF: 1.67\n"
	           "> AVG TXS PER TIME UNIT: 0.60\n"
	           "> AVG TXS PER TIMESTAMP: 1.25\n",
	run_stats (graph));
}

TEST (stats, order)
{
	ledgerstats::graph graph;
	auto stats (ledgerstats::stat::make_default (graph));
	auto const & accumulators (stats.accumulators ());
	ASSERT_EQ (4, accumulators.size ());
	ASSERT_NE (nullptr, dynamic_cast<ledgerstats::depths *> (accumulators[0].get ()));
	ASSERT_NE (nullptr, dynamic_cast<ledgerstats::in_references *> (accumulators[1].get ()));
	ASSERT_NE (nullptr, dynamic_cast<ledgerstats::time_units *> (accumulators[2].get ()));
	ASSERT_NE (nullptr, dynamic_cast<ledgerstats::timestamps *> (accumulators[3].get ()));
}

TEST (stats, no_transactions)
{
	ledgerstats::graph graph;
	ASSERT_EQ ("> AVG DAG DEPTH: 0.00\n"
	           "> AVG TXS PER DEPTH: 0.00\n"
	           "> AVG REF: 0.00\n"
	           "> AVG TXS PER TIME UNIT: 0.00\n"
	           "> AVG TXS PER TIMESTAMP: 0.00\n",
	run_stats (graph));
}

TEST (stats, depths)
{
	auto graph (ledgerstats::make_graph ({ { 1, 1, 5 }, { 2, 2, 7 }, { 3, 3, 7 }, { 4, 4, 10 } }));
	ledgerstats::depths depths (graph);
	for (auto const & transaction : graph.transactions ())
	{
		depths.accumulate (transaction);
	}
	std::unique_ptr<ledgerstats::stat_result> result;
	ASSERT_FALSE (depths.result (4.0, result));
	ASSERT_NE (nullptr, result);
	auto depths_result (dynamic_cast<ledgerstats::depths_result *> (result.get ()));
	ASSERT_NE (nullptr, depths_result);
	ASSERT_DOUBLE_EQ (2.0, depths_result->average_depth);
	ASSERT_DOUBLE_EQ (1.0, depths_result->average_transactions_per_depth);
	ASSERT_EQ ("> AVG DAG DEPTH: 2.00\n> AVG TXS PER DEPTH: 1.00", result->to_string ());
}

TEST (stats, depths_cyclic)
{
	auto graph (ledgerstats::make_graph ({ { 3, 3, 0 }, { 2, 2, 0 } }));
	ledgerstats::depths depths (graph);
	for (auto const & transaction : graph.transactions ())
	{
		depths.accumulate (transaction);
	}
	std::unique_ptr<ledgerstats::stat_result> result;
	auto error (depths.result (2.0, result));
	ASSERT_EQ (ledgerstats::error_validation::cyclic, error.error_code ());
	ASSERT_EQ (nullptr, result);
}

TEST (stats, in_references)
{
	auto graph (ledgerstats::make_graph ({ { 1, 1, 1 }, { 1, 1, 1 }, { 2, 3, 2 } }));
	ledgerstats::in_references references (graph);
	for (auto const & transaction : graph.transactions ())
	{
		references.accumulate (transaction);
	}
	std::unique_ptr<ledgerstats::stat_result> result;
	ASSERT_FALSE (references.result (3.0, result));
	// Root 4, Tx:2 1, Tx:3 1 over 4 vertices
	ASSERT_EQ ("> AVG REF: 1.50", result->to_string ());
}

TEST (stats, time_units)
{
	ledgerstats::time_units time_units;
	time_units.accumulate (transaction (2, 4));
	time_units.accumulate (transaction (3, 9));
	time_units.accumulate (transaction (4, 6));
	std::unique_ptr<ledgerstats::stat_result> result;
	ASSERT_FALSE (time_units.result (3.0, result));
	ASSERT_EQ ("> AVG TXS PER TIME UNIT: 3.00", result->to_string ());
}

TEST (stats, time_units_conversion)
{
	ledgerstats::time_units time_units;
	time_units.accumulate (transaction (2, (uint64_t (1) << 53) + 1));
	std::unique_ptr<ledgerstats::stat_result> result;
	auto error (time_units.result (1.0, result));
	ASSERT_EQ (ledgerstats::error_common::numeric_conversion, error.error_code ());
	ASSERT_EQ (nullptr, result);
}

TEST (stats, timestamps)
{
	ledgerstats::timestamps timestamps;
	timestamps.accumulate (transaction (2, 1));
	timestamps.accumulate (transaction (3, 1));
	timestamps.accumulate (transaction (4, 2));
	std::unique_ptr<ledgerstats::stat_result> result;
	ASSERT_FALSE (timestamps.result (3.0, result));
	ASSERT_EQ ("> AVG TXS PER TIMESTAMP: 1.50", result->to_string ());
}

TEST (stats, write_stops_at_failure)
{
	auto graph (ledgerstats::make_graph ({ { 1, 1, (uint64_t (1) << 53) + 1 } }));
	auto stats (ledgerstats::stat::make_default (graph));
	stats.collect ();
	std::ostringstream stream;
	auto error (stats.write (stream));
	ASSERT_EQ (ledgerstats::error_common::numeric_conversion, error.error_code ());
	// Depths and references were printed before the time units failed
	ASSERT_EQ ("> AVG DAG DEPTH: 0.50\n"
	           "> AVG TXS PER DEPTH: 1.00\n"
	           "> AVG REF: 1.00\n",
	stream.str ());
}
