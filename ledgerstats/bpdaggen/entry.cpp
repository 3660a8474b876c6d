#include <ledgerstats/lib/logger_mt.hpp>
#include <ledgerstats/lib/numbers.hpp>
#include <ledgerstats/node/logging.hpp>
#include <ledgerstats/node/testing.hpp>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <random>

int main (int argc, char * const * argv)
{
	try
	{
		boost::program_options::options_description description ("Generate random bipartite DAGs");
		// clang-format off
		description.add_options ()
			("help", "Print out options")
			("n_vertices", boost::program_options::value<std::string> (), "Number of vertices")
			("seed", boost::program_options::value<uint64_t> (), "Seed of the random generator, random if omitted")
			("log_level", boost::program_options::value<std::string> ()->default_value ("warning"), "Minimum severity written to standard error");
		// clang-format on
		boost::program_options::positional_options_description positional;
		positional.add ("n_vertices", 1);
		boost::program_options::variables_map vm;
		try
		{
			boost::program_options::store (boost::program_options::command_line_parser (argc, argv).options (description).positional (positional).run (), vm);
		}
		catch (boost::program_options::error const & err)
		{
			std::cerr << err.what () << std::endl;
			std::cerr << "Usage: bpdaggen <n_vertices> [options]\n"
			          << description << std::endl;
			return 1;
		}
		boost::program_options::notify (vm);
		if (vm.count ("help") != 0 || vm.count ("n_vertices") == 0)
		{
			std::cout << "Usage: bpdaggen <n_vertices> [options]\n"
			          << description << std::endl;
			return vm.count ("help") != 0 ? 0 : 1;
		}
		uint64_t vertices (0);
		auto ec (ledgerstats::decode_dec (vm["n_vertices"].as<std::string> (), vertices));
		if (ec)
		{
			std::cerr << "Invalid number of vertices: " << ec.message () << std::endl;
			return 1;
		}
		ledgerstats::logging logging;
		logging.level = vm["log_level"].as<std::string> ();
		ledgerstats::severity_level level;
		if (ledgerstats::parse_severity (logging.level, level))
		{
			std::cerr << "Invalid log level " << logging.level << std::endl;
			return 1;
		}
		logging.init ();
		uint64_t seed (0);
		if (vm.count ("seed") != 0)
		{
			seed = vm["seed"].as<uint64_t> ();
		}
		else
		{
			std::random_device device;
			seed = (static_cast<uint64_t> (device ()) << 32) | device ();
		}
		ledgerstats::logger_mt logger;
		logger.always_log ("Seed = ", seed);
		ledgerstats::bipartite_dag_generator generator (logger, seed);
		ledgerstats::write_ledger (generator.generate (vertices), std::cout);
		return 0;
	}
	catch (std::exception const & e)
	{
		std::cerr << boost::str (boost::format ("Exception while initializing %1%") % e.what ()) << std::endl;
	}
	return 1;
}
