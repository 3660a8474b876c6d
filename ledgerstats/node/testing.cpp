#include <ledgerstats/node/testing.hpp>
#include <ledgerstats/secure/utility.hpp>

#include <algorithm>
#include <cstdlib>

ledgerstats::bipartite_dag_generator::bipartite_dag_generator (ledgerstats::logger_mt & logger_a, uint64_t seed_a) :
logger (logger_a),
rng (seed_a)
{
}

ledgerstats::graph ledgerstats::bipartite_dag_generator::generate (uint64_t count_a)
{
	std::vector<ledgerstats::transaction> transactions;
	transactions.reserve (count_a);
	// Indexed by identifier number, 0 unused
	std::vector<uint64_t> timestamps (2, 0);
	std::vector<uint64_t> reds{ ledgerstats::root_number };
	std::vector<uint64_t> blues;
	for (uint64_t number (2); number < count_a + 2; ++number)
	{
		std::error_code ec;
		ledgerstats::transaction_id id (ec, number);
		if (number == 2)
		{
			timestamps.push_back (uniform (0, 99));
			transactions.emplace_back (id, ledgerstats::identifier::root (), ledgerstats::identifier::root (), timestamps.back ());
			blues.push_back (number);
		}
		else
		{
			auto red (uniform (0, 1) == 1);
			auto & sources (red ? blues : reds);
			auto left (pick (sources));
			auto right (pick (sources));
			logger.log (ledgerstats::severity_level::debug, red ? "RED" : "BLUE", " left = ", left, ", right = ", right);
			auto min_timestamp (std::max (timestamps[left.number ()], timestamps[right.number ()]) + uniform (1, 99));
			auto max_timestamp (min_timestamp + uniform (1, 99));
			timestamps.push_back (uniform (min_timestamp, max_timestamp));
			transactions.emplace_back (id, left, right, timestamps.back ());
			(red ? reds : blues).push_back (number);
		}
	}
	return ledgerstats::graph (transactions);
}

ledgerstats::identifier ledgerstats::bipartite_dag_generator::pick (std::vector<uint64_t> const & candidates_a)
{
	std::error_code ec;
	return ledgerstats::identifier (ec, candidates_a[uniform (0, candidates_a.size () - 1)]);
}

uint64_t ledgerstats::bipartite_dag_generator::uniform (uint64_t min_a, uint64_t max_a)
{
	std::uniform_int_distribution<uint64_t> distribution (min_a, max_a);
	return distribution (rng);
}

void ledgerstats::write_ledger (ledgerstats::graph const & graph_a, std::ostream & stream_a)
{
	stream_a << graph_a.size () << '\n';
	for (auto const & transaction : graph_a.transactions ())
	{
		stream_a << transaction.left ().number () << ' ' << transaction.right ().number () << ' ' << transaction.timestamp () << '\n';
	}
}

namespace ledgerstats
{
void cleanup_test_directories_on_exit ()
{
	// Clean up tmp directories created by the tests. Since it's sometimes useful to
	// see the files after test failures, an environment variable is supported to
	// retain them.
	if (std::getenv ("TEST_KEEP_TMPDIRS") == nullptr)
	{
		ledgerstats::remove_temporary_directories ();
	}
}
}
