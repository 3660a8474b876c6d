#include <ledgerstats/node/cli.hpp>

std::string ledgerstats::error_cli_messages::message (int ev) const
{
	switch (static_cast<ledgerstats::error_cli> (ev))
	{
		case ledgerstats::error_cli::generic:
			return "Unknown error";
		case ledgerstats::error_cli::parse_error:
			return "Could not parse command line";
		case ledgerstats::error_cli::invalid_arguments:
			return "Invalid arguments";
		case ledgerstats::error_cli::unknown_command:
			return "Unknown command";
		case ledgerstats::error_cli::missing_input:
			return "No input file given";
		case ledgerstats::error_cli::input_unreadable:
			return "Input file could not be opened";
	}

	return "Invalid error code";
}

void ledgerstats::add_options (boost::program_options::options_description & description_a, boost::program_options::positional_options_description & positional_a)
{
	// clang-format off
	description_a.add_options ()
		("input_file", boost::program_options::value<std::string> (), "Input file")
		("disable_validation,d", "Disable (slow) graph validation")
		("config", boost::program_options::value<std::string> (), "Use the JSON configuration file at the given path, creating it with defaults if it does not exist");
	// clang-format on
	positional_a.add ("input_file", 1);
}

ledgerstats::error ledgerstats::handle_options (boost::program_options::variables_map const & vm, ledgerstats::ledgerstats_config & config_a, boost::filesystem::path & input_a)
{
	ledgerstats::error ec;
	if (vm.count ("help") != 0)
	{
		ec = ledgerstats::error_cli::unknown_command;
	}
	else
	{
		auto config_it (vm.find ("config"));
		if (config_it != vm.end ())
		{
			boost::filesystem::path config_path (config_it->second.as<std::string> ());
			ec = ledgerstats::read_and_update_ledgerstats_config (config_path, config_a);
			ec.wrap ("Error deserializing config " + config_path.string ());
		}
		if (!ec)
		{
			if (vm.count ("disable_validation") != 0)
			{
				config_a.validation = false;
			}
			auto input_it (vm.find ("input_file"));
			if (input_it != vm.end ())
			{
				input_a = input_it->second.as<std::string> ();
			}
			else
			{
				ec = ledgerstats::error_cli::missing_input;
			}
		}
	}
	return ec;
}

int ledgerstats::exit_code (ledgerstats::error const & error_a)
{
	auto result (0);
	if (error_a)
	{
		auto code (error_a.error_code ());
		if (code == ledgerstats::error_validation::cyclic)
		{
			result = 3;
		}
		else if (code == ledgerstats::error_validation::disconnected)
		{
			result = 4;
		}
		else if (code.category () == ledgerstats::error_graph_category () || code.category () == ledgerstats::error_transaction_category () || code.category () == ledgerstats::error_identifier_category () || code.category () == ledgerstats::error_number_category ())
		{
			result = 2;
		}
		else
		{
			result = 1;
		}
	}
	return result;
}
