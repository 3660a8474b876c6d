#include <gtest/gtest.h>

#include <ledgerstats/core_test/testutil.hpp>
#include <ledgerstats/node/analyzer.hpp>
#include <ledgerstats/node/cli.hpp>
#include <ledgerstats/secure/utility.hpp>

#include <boost/filesystem.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace
{
std::string read_file (boost::filesystem::path const & path_a)
{
	std::ifstream stream (path_a.string ());
	return std::string (std::istreambuf_iterator<char> (stream), std::istreambuf_iterator<char> ());
}
}

TEST (analyzer, example)
{
	ledgerstats::ledgerstats_config config;
	ledgerstats::logger_mt logger;
	ledgerstats::analyzer analyzer (config, logger);
	std::istringstream input (ledgerstats::example_ledger);
	std::ostringstream output;
	auto error (analyzer.run (input, output));
	ASSERT_FALSE (error);
	ASSERT_EQ ("> AVG DAG DEPTH: 1.33\n"
	           "> AVG TXS PER DEPTH: 2.50\n"
	           "> AVG REF: 1.67\n"
	           "> AVG TXS PER TIME UNIT: 0.60\n"
	           "> AVG TXS PER TIMESTAMP: 1.25\n",
	output.str ());
}

TEST (analyzer, files)
{
	boost::filesystem::path testdata (LEDGERSTATS_TESTDATA_DIR);
	ASSERT_TRUE (boost::filesystem::is_directory (testdata));
	ledgerstats::ledgerstats_config config;
	ledgerstats::logger_mt logger;
	ledgerstats::analyzer analyzer (config, logger);
	auto count (0);
	for (boost::filesystem::directory_iterator i (testdata), n; i != n; ++i)
	{
		auto path (i->path ());
		if (path.extension () == ".in")
		{
			std::ostringstream output;
			auto error (analyzer.run (path, output));
			ASSERT_FALSE (error) << path.string () << ": " << error.get_message ();
			auto expected (path);
			expected.replace_extension (".out");
			ASSERT_TRUE (boost::filesystem::exists (expected)) << expected.string ();
			ASSERT_EQ (read_file (expected), output.str ()) << path.string ();
			++count;
		}
	}
	ASSERT_LE (3, count);
}

TEST (analyzer, unreadable_input)
{
	ledgerstats::ledgerstats_config config;
	ledgerstats::logger_mt logger;
	ledgerstats::analyzer analyzer (config, logger);
	std::ostringstream output;
	auto path (ledgerstats::unique_path ());
	auto error (analyzer.run (path, output));
	ASSERT_EQ (ledgerstats::error_cli::input_unreadable, error.error_code ());
	ASSERT_EQ (1, ledgerstats::exit_code (error));
	ASSERT_TRUE (output.str ().empty ());
}

TEST (analyzer, malformed)
{
	ledgerstats::ledgerstats_config config;
	ledgerstats::logger_mt logger;
	ledgerstats::analyzer analyzer (config, logger);
	std::istringstream input ("2\n1 1 0\n");
	std::ostringstream output;
	auto error (analyzer.run (input, output));
	ASSERT_EQ (ledgerstats::error_graph::too_little_transactions, error.error_code ());
	ASSERT_EQ (2, ledgerstats::exit_code (error));
	ASSERT_TRUE (output.str ().empty ());
}

TEST (analyzer, cyclic)
{
	ledgerstats::ledgerstats_config config;
	ledgerstats::logger_mt logger;
	ledgerstats::analyzer analyzer (config, logger);
	std::istringstream input ("3\n1 3\t0\n1 4 0\n1 2 0\n");
	std::ostringstream output;
	auto error (analyzer.run (input, output));
	ASSERT_EQ (ledgerstats::error_validation::cyclic, error.error_code ());
	ASSERT_EQ ("Graph is connected but cyclic, this is not supported", error.get_message ());
	ASSERT_EQ (3, ledgerstats::exit_code (error));
	ASSERT_TRUE (output.str ().empty ());
}

TEST (analyzer, unconnected)
{
	ledgerstats::ledgerstats_config config;
	ledgerstats::logger_mt logger;
	ledgerstats::analyzer analyzer (config, logger);
	std::istringstream input ("2\n3 3 0\n2 2 0\n");
	std::ostringstream output;
	auto error (analyzer.run (input, output));
	ASSERT_EQ (ledgerstats::error_validation::disconnected, error.error_code ());
	ASSERT_EQ (4, ledgerstats::exit_code (error));
}

TEST (analyzer, not_bipartite_is_not_fatal)
{
	ledgerstats::ledgerstats_config config;
	ledgerstats::logger_mt logger;
	ledgerstats::analyzer analyzer (config, logger);
	auto graph (ledgerstats::make_graph ({ { 1, 1, 0 }, { 2, 1, 0 } }));
	ASSERT_FALSE (analyzer.validate (graph));
}

TEST (analyzer, validation_disabled)
{
	ledgerstats::ledgerstats_config config;
	config.validation = false;
	ledgerstats::logger_mt logger;
	ledgerstats::analyzer analyzer (config, logger);
	{
		std::istringstream input (ledgerstats::example_ledger);
		std::ostringstream output;
		ASSERT_FALSE (analyzer.run (input, output));
		auto text (output.str ());
		ASSERT_EQ (5, std::count (text.begin (), text.end (), '\n'));
	}
	{
		// Without validation the cycle is only found by the depth statistic
		std::istringstream input ("2\n3 3 0\n2 2 0\n");
		std::ostringstream output;
		auto error (analyzer.run (input, output));
		ASSERT_EQ (ledgerstats::error_validation::cyclic, error.error_code ());
		ASSERT_TRUE (output.str ().empty ());
	}
}

TEST (analyzer, read_failure)
{
	ledgerstats::ledgerstats_config config;
	ledgerstats::logger_mt logger;
	ledgerstats::analyzer analyzer (config, logger);
	ledgerstats::failing_buffer buffer ("2\n1 1 0\n");
	std::istream input (&buffer);
	std::ostringstream output;
	auto error (analyzer.run (input, output));
	ASSERT_EQ (ledgerstats::error_graph::io, error.error_code ());
	ASSERT_EQ (2, ledgerstats::exit_code (error));
	ASSERT_TRUE (output.str ().empty ());
}
