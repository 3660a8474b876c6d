#pragma once

#include <ledgerstats/lib/logger_mt.hpp>
#include <ledgerstats/secure/graph.hpp>

#include <ostream>
#include <random>
#include <vector>

namespace ledgerstats
{
/**
 * Produces random ledgers which are connected, acyclic and bipartite.
 * Vertices are coloured red or blue, Root being red, and every transaction references
 * two vertices of the other colour. Timestamps grow along every reference.
 */
class bipartite_dag_generator final
{
public:
	bipartite_dag_generator (ledgerstats::logger_mt &, uint64_t);
	ledgerstats::graph generate (uint64_t);

private:
	ledgerstats::identifier pick (std::vector<uint64_t> const &);
	uint64_t uniform (uint64_t, uint64_t);
	ledgerstats::logger_mt & logger;
	std::mt19937_64 rng;
};

/** Write \p graph_a in the line format read by the graph builder */
void write_ledger (ledgerstats::graph const & graph_a, std::ostream &);
void cleanup_test_directories_on_exit ();
}
