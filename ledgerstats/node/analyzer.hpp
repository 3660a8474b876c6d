#pragma once

#include <ledgerstats/lib/errors.hpp>
#include <ledgerstats/lib/logger_mt.hpp>
#include <ledgerstats/node/ledgerstats_config.hpp>
#include <ledgerstats/secure/graph.hpp>

#include <boost/filesystem.hpp>

#include <istream>
#include <ostream>

namespace ledgerstats
{
/**
 * Load a ledger description, validate its structure and print the statistics.
 * Validation failures and errors are logged, results go to the output stream.
 */
class analyzer
{
public:
	analyzer (ledgerstats::ledgerstats_config const &, ledgerstats::logger_mt &);
	ledgerstats::error run (boost::filesystem::path const &, std::ostream &);
	ledgerstats::error run (std::istream &, std::ostream &);
	/** Connectivity, acyclicity and bipartiteness; only the first two are fatal */
	ledgerstats::error validate (ledgerstats::graph const &);
	/** Run every statistic over \p graph_a and print the results in order */
	ledgerstats::error statistics (ledgerstats::graph const & graph_a, std::ostream &);
	ledgerstats::ledgerstats_config const & config;
	ledgerstats::logger_mt & logger;
};
}
