#include <ledgerstats/lib/errors.hpp>
#include <ledgerstats/lib/logger_mt.hpp>
#include <ledgerstats/node/analyzer.hpp>
#include <ledgerstats/node/cli.hpp>
#include <ledgerstats/node/ledgerstats_config.hpp>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include <iostream>

int main (int argc, char * const * argv)
{
	try
	{
		boost::program_options::options_description description ("Command line options");
		boost::program_options::positional_options_description positional;
		description.add_options () ("help", "Print out options");
		ledgerstats::add_options (description, positional);
		boost::program_options::variables_map vm;
		try
		{
			boost::program_options::store (boost::program_options::command_line_parser (argc, argv).options (description).positional (positional).run (), vm);
		}
		catch (boost::program_options::error const & err)
		{
			std::cerr << err.what () << std::endl;
			std::cerr << "Usage: ledgerstats [options] <input-file>\n"
			          << description << std::endl;
			return 1;
		}
		boost::program_options::notify (vm);

		ledgerstats::ledgerstats_config config;
		boost::filesystem::path input;
		auto error (ledgerstats::handle_options (vm, config, input));
		if (error == ledgerstats::error_cli::unknown_command)
		{
			std::cout << "Usage: ledgerstats [options] <input-file>\n"
			          << description << std::endl;
			return 0;
		}
		if (error)
		{
			std::cerr << error.get_message () << std::endl;
			if (error == ledgerstats::error_cli::missing_input)
			{
				std::cerr << "Usage: ledgerstats [options] <input-file>\n"
				          << description << std::endl;
			}
			return ledgerstats::exit_code (error);
		}

		config.logging.init ();
		ledgerstats::logger_mt logger;
		ledgerstats::analyzer analyzer (config, logger);
		return ledgerstats::exit_code (analyzer.run (input, std::cout));
	}
	catch (std::exception const & e)
	{
		std::cerr << boost::str (boost::format ("Exception while initializing %1%") % e.what ()) << std::endl;
	}
	return 1;
}
