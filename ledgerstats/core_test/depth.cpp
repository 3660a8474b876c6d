#include <gtest/gtest.h>

#include <ledgerstats/core_test/testutil.hpp>
#include <ledgerstats/secure/depth.hpp>

namespace
{
ledgerstats::identifier id (uint64_t number_a)
{
	std::error_code ec;
	ledgerstats::identifier result (ec, number_a);
	EXPECT_FALSE (ec);
	return result;
}
}

TEST (depth, root)
{
	ledgerstats::graph graph;
	ledgerstats::depth_calculator calculator (graph);
	auto depth (calculator.depth (ledgerstats::identifier::root ()));
	ASSERT_TRUE (depth);
	ASSERT_EQ (0, *depth);
	ASSERT_EQ (0, calculator.cached ());
}

TEST (depth, example)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, ledgerstats::example_ledger));
	ASSERT_FALSE (error);
	ledgerstats::depth_calculator calculator (graph);
	std::vector<uint64_t> expected{ 1, 1, 2, 2, 2 };
	for (uint64_t i (0); i < expected.size (); ++i)
	{
		auto depth (calculator.depth (id (i + 2)));
		ASSERT_TRUE (depth);
		ASSERT_EQ (expected[i], *depth);
	}
	ASSERT_EQ (5, calculator.cached ());
}

TEST (depth, shortest_path)
{
	// Tx:4 is one step from Root through its right reference
	auto graph (ledgerstats::make_graph ({ { 1, 1, 0 }, { 2, 2, 1 }, { 3, 1, 2 } }));
	ledgerstats::depth_calculator calculator (graph);
	ASSERT_EQ (2, *calculator.depth (id (3)));
	ASSERT_EQ (1, *calculator.depth (id (4)));
}

TEST (depth, cache_shared)
{
	auto graph (ledgerstats::make_graph ({ { 1, 1, 0 }, { 2, 2, 1 }, { 2, 3, 2 }, { 3, 4, 3 }, { 4, 5, 4 } }));
	ledgerstats::depth_calculator calculator (graph);
	ASSERT_EQ (3, *calculator.depth (id (5)));
	// Tx:2, Tx:3, Tx:4 and Tx:5 were computed along the way
	ASSERT_EQ (4, calculator.cached ());
	ASSERT_EQ (2, *calculator.depth (id (4)));
	ASSERT_EQ (4, calculator.cached ());
	ASSERT_EQ (3, *calculator.depth (id (6)));
	ASSERT_EQ (5, calculator.cached ());
}

TEST (depth, cycle)
{
	auto graph (ledgerstats::make_graph ({ { 3, 3, 0 }, { 2, 2, 0 } }));
	ledgerstats::depth_calculator calculator (graph);
	ASSERT_FALSE (calculator.depth (id (2)));
	ASSERT_FALSE (calculator.depth (id (3)));
}

TEST (depth, self_reference)
{
	auto graph (ledgerstats::make_graph ({ { 2, 2, 0 } }));
	ledgerstats::depth_calculator calculator (graph);
	ASSERT_FALSE (calculator.depth (id (2)));
}

TEST (depth, outside_graph)
{
	auto graph (ledgerstats::make_graph ({ { 1, 1, 0 }, { 9, 2, 0 } }));
	ledgerstats::depth_calculator calculator (graph);
	ASSERT_FALSE (calculator.depth (id (3)));
	ASSERT_FALSE (calculator.depth (id (7)));
	// Unaffected by the failed queries
	ASSERT_EQ (1, *calculator.depth (id (2)));
}

TEST (depth, long_chain)
{
	std::vector<std::array<uint64_t, 3>> entries;
	uint64_t const length (200000);
	for (uint64_t i (0); i < length; ++i)
	{
		entries.push_back ({ { i + 1, i + 1, i } });
	}
	auto graph (ledgerstats::make_graph (entries));
	ledgerstats::depth_calculator calculator (graph);
	auto depth (calculator.depth (id (length + 1)));
	ASSERT_TRUE (depth);
	ASSERT_EQ (length, *depth);
}
