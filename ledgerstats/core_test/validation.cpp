#include <gtest/gtest.h>

#include <ledgerstats/core_test/testutil.hpp>
#include <ledgerstats/secure/validation.hpp>

TEST (validation, empty_graph)
{
	ledgerstats::graph graph;
	auto result (ledgerstats::is_connected_acyclic (graph));
	ASSERT_TRUE (result);
	ASSERT_TRUE (*result);
	ASSERT_TRUE (ledgerstats::is_bipartite (graph));
}

TEST (validation, connected_acyclic)
{
	auto graph (ledgerstats::make_graph ({ { 1, 1, 0 }, { 2, 1, 0 } }));
	auto result (ledgerstats::is_connected_acyclic (graph));
	ASSERT_TRUE (result);
	ASSERT_TRUE (*result);
	ASSERT_FALSE (ledgerstats::validation_error (result));
}

TEST (validation, example)
{
	ledgerstats::error error;
	auto graph (ledgerstats::read_graph (error, ledgerstats::example_ledger));
	ASSERT_FALSE (error);
	auto result (ledgerstats::is_connected_acyclic (graph));
	ASSERT_TRUE (result);
	ASSERT_TRUE (*result);
	ASSERT_FALSE (ledgerstats::is_bipartite (graph));
}

TEST (validation, cyclic)
{
	auto graph (ledgerstats::make_graph ({ { 1, 3, 0 }, { 1, 4, 0 }, { 1, 2, 0 } }));
	auto result (ledgerstats::is_connected_acyclic (graph));
	ASSERT_TRUE (result);
	ASSERT_FALSE (*result);
	ASSERT_EQ (ledgerstats::error_validation::cyclic, ledgerstats::validation_error (result));
}

TEST (validation, self_reference)
{
	auto graph (ledgerstats::make_graph ({ { 1, 1, 0 }, { 1, 3, 0 } }));
	auto result (ledgerstats::is_connected_acyclic (graph));
	ASSERT_TRUE (result);
	ASSERT_FALSE (*result);
}

TEST (validation, unconnected)
{
	auto graph (ledgerstats::make_graph ({ { 3, 3, 0 }, { 2, 2, 0 } }));
	auto result (ledgerstats::is_connected_acyclic (graph));
	ASSERT_FALSE (result);
	ASSERT_EQ (ledgerstats::error_validation::disconnected, ledgerstats::validation_error (result));
}

TEST (validation, cycle_beats_unreachable)
{
	// Tx:4 and Tx:5 reference each other and are unreachable, Tx:2 and Tx:3 form a reachable cycle
	auto graph (ledgerstats::make_graph ({ { 1, 3, 0 }, { 2, 2, 0 }, { 5, 5, 0 }, { 4, 4, 0 } }));
	auto result (ledgerstats::is_connected_acyclic (graph));
	ASSERT_TRUE (result);
	ASSERT_FALSE (*result);
}

TEST (validation, diamond_sharing)
{
	// Shared ancestors reached along several paths are not cycles
	auto graph (ledgerstats::make_graph ({ { 1, 1, 0 }, { 2, 2, 1 }, { 2, 3, 2 }, { 3, 4, 3 }, { 4, 5, 4 }, { 5, 6, 5 } }));
	auto result (ledgerstats::is_connected_acyclic (graph));
	ASSERT_TRUE (result);
	ASSERT_TRUE (*result);
}

TEST (validation, bipartite)
{
	auto graph (ledgerstats::make_graph ({ { 1, 1, 0 }, { 2, 2, 0 } }));
	ASSERT_TRUE (ledgerstats::is_bipartite (graph));
	auto graph2 (ledgerstats::make_graph ({ { 1, 1, 0 }, { 2, 2, 1 }, { 3, 1, 2 }, { 4, 2, 3 } }));
	ASSERT_TRUE (ledgerstats::is_bipartite (graph2));
}

TEST (validation, not_bipartite)
{
	auto graph (ledgerstats::make_graph ({ { 1, 1, 0 }, { 2, 1, 0 } }));
	ASSERT_FALSE (ledgerstats::is_bipartite (graph));
}

TEST (validation, long_chain)
{
	// Deep enough to exhaust the call stack of a recursive walk
	std::vector<std::array<uint64_t, 3>> entries;
	uint64_t const length (200000);
	for (uint64_t i (0); i < length; ++i)
	{
		entries.push_back ({ { i + 1, i + 1, i } });
	}
	auto graph (ledgerstats::make_graph (entries));
	auto result (ledgerstats::is_connected_acyclic (graph));
	ASSERT_TRUE (result);
	ASSERT_TRUE (*result);
	ASSERT_TRUE (ledgerstats::is_bipartite (graph));
}
