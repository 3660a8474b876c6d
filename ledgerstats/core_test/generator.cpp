#include <gtest/gtest.h>

#include <ledgerstats/node/stats.hpp>
#include <ledgerstats/node/testing.hpp>
#include <ledgerstats/secure/validation.hpp>

#include <sstream>

TEST (generator, empty)
{
	ledgerstats::logger_mt logger;
	ledgerstats::bipartite_dag_generator generator (logger, 1);
	auto graph (generator.generate (0));
	ASSERT_TRUE (graph.empty ());
	std::ostringstream stream;
	ledgerstats::write_ledger (graph, stream);
	ASSERT_EQ ("0\n", stream.str ());
}

TEST (generator, single)
{
	ledgerstats::logger_mt logger;
	ledgerstats::bipartite_dag_generator generator (logger, 1);
	auto graph (generator.generate (1));
	ASSERT_EQ (1, graph.size ());
	auto const & transaction (graph.transactions ()[0]);
	ASSERT_TRUE (transaction.left ().is_root ());
	ASSERT_TRUE (transaction.right ().is_root ());
	ASSERT_LT (transaction.timestamp (), 100);
}

TEST (generator, structure)
{
	ledgerstats::logger_mt logger;
	ledgerstats::bipartite_dag_generator generator (logger, 42);
	auto graph (generator.generate (500));
	ASSERT_EQ (500, graph.size ());
	auto connected_acyclic (ledgerstats::is_connected_acyclic (graph));
	ASSERT_TRUE (connected_acyclic);
	ASSERT_TRUE (*connected_acyclic);
	ASSERT_TRUE (ledgerstats::is_bipartite (graph));
	for (auto const & transaction : graph.transactions ())
	{
		ASSERT_LT (transaction.left ().number (), transaction.id ().number ());
		ASSERT_LT (transaction.right ().number (), transaction.id ().number ());
		if (transaction.id ().number () > 2)
		{
			for (auto const & reference : { transaction.left (), transaction.right () })
			{
				auto reference_timestamp (reference.is_root () ? uint64_t (0) : graph.get (reference.transaction ()).timestamp ());
				ASSERT_GT (transaction.timestamp (), reference_timestamp);
			}
		}
	}
}

TEST (generator, reproducible)
{
	ledgerstats::logger_mt logger;
	ledgerstats::bipartite_dag_generator generator1 (logger, 7);
	ledgerstats::bipartite_dag_generator generator2 (logger, 7);
	ASSERT_TRUE (generator1.generate (100) == generator2.generate (100));
}

TEST (generator, readable)
{
	ledgerstats::logger_mt logger;
	ledgerstats::bipartite_dag_generator generator (logger, 3);
	auto graph (generator.generate (50));
	std::stringstream stream;
	ledgerstats::write_ledger (graph, stream);
	ledgerstats::error error;
	ledgerstats::graph read (error, stream);
	ASSERT_FALSE (error);
	ASSERT_TRUE (graph == read);
	auto stats (ledgerstats::stat::make_default (read));
	stats.collect ();
	std::ostringstream output;
	ASSERT_FALSE (stats.write (output));
}
