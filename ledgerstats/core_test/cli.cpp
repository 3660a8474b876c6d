#include <gtest/gtest.h>

#include <ledgerstats/node/cli.hpp>
#include <ledgerstats/secure/utility.hpp>

#include <vector>

namespace
{
boost::program_options::variables_map parse (std::vector<char const *> arguments_a)
{
	boost::program_options::options_description description;
	boost::program_options::positional_options_description positional;
	description.add_options () ("help", "Print out options");
	ledgerstats::add_options (description, positional);
	arguments_a.insert (arguments_a.begin (), "ledgerstats");
	boost::program_options::variables_map vm;
	boost::program_options::store (boost::program_options::command_line_parser (static_cast<int> (arguments_a.size ()), arguments_a.data ()).options (description).positional (positional).run (), vm);
	boost::program_options::notify (vm);
	return vm;
}
}

TEST (cli, input_file)
{
	auto vm (parse ({ "ledger.in" }));
	ledgerstats::ledgerstats_config config;
	boost::filesystem::path input;
	auto error (ledgerstats::handle_options (vm, config, input));
	ASSERT_FALSE (error);
	ASSERT_EQ ("ledger.in", input.string ());
	ASSERT_TRUE (config.validation);
}

TEST (cli, disable_validation)
{
	auto vm (parse ({ "-d", "ledger.in" }));
	ledgerstats::ledgerstats_config config;
	boost::filesystem::path input;
	ASSERT_FALSE (ledgerstats::handle_options (vm, config, input));
	ASSERT_FALSE (config.validation);
	auto vm2 (parse ({ "ledger.in", "--disable_validation" }));
	ledgerstats::ledgerstats_config config2;
	ASSERT_FALSE (ledgerstats::handle_options (vm2, config2, input));
	ASSERT_FALSE (config2.validation);
}

TEST (cli, missing_input)
{
	auto vm (parse ({ "-d" }));
	ledgerstats::ledgerstats_config config;
	boost::filesystem::path input;
	auto error (ledgerstats::handle_options (vm, config, input));
	ASSERT_EQ (ledgerstats::error_cli::missing_input, error.error_code ());
	ASSERT_EQ (1, ledgerstats::exit_code (error));
}

TEST (cli, help)
{
	auto vm (parse ({ "--help" }));
	ledgerstats::ledgerstats_config config;
	boost::filesystem::path input;
	auto error (ledgerstats::handle_options (vm, config, input));
	ASSERT_EQ (ledgerstats::error_cli::unknown_command, error.error_code ());
}

TEST (cli, too_many_inputs)
{
	ASSERT_THROW (parse ({ "a.in", "b.in" }), boost::program_options::error);
}

TEST (cli, config_file)
{
	auto path (ledgerstats::unique_path ());
	auto path_string (path.string ());
	auto vm (parse ({ "--config", path_string.c_str (), "ledger.in" }));
	ledgerstats::ledgerstats_config config;
	boost::filesystem::path input;
	ASSERT_FALSE (ledgerstats::handle_options (vm, config, input));
	ASSERT_TRUE (boost::filesystem::exists (path));
	ASSERT_TRUE (config.validation);
	// Command line flags win over the file
	auto vm2 (parse ({ "--config", path_string.c_str (), "-d", "ledger.in" }));
	ledgerstats::ledgerstats_config config2;
	ASSERT_FALSE (ledgerstats::handle_options (vm2, config2, input));
	ASSERT_FALSE (config2.validation);
}

TEST (cli, exit_code)
{
	ASSERT_EQ (0, ledgerstats::exit_code (ledgerstats::error ()));
	ASSERT_EQ (1, ledgerstats::exit_code (ledgerstats::error (ledgerstats::error_cli::input_unreadable)));
	ASSERT_EQ (1, ledgerstats::exit_code (ledgerstats::error (ledgerstats::error_common::numeric_conversion)));
	ASSERT_EQ (1, ledgerstats::exit_code (ledgerstats::error (ledgerstats::error_config::invalid_value)));
	ASSERT_EQ (1, ledgerstats::exit_code (ledgerstats::error (ledgerstats::error_common::io)));
	ASSERT_EQ (2, ledgerstats::exit_code (ledgerstats::error (ledgerstats::error_graph::invalid_count)));
	ASSERT_EQ (2, ledgerstats::exit_code (ledgerstats::error (ledgerstats::error_graph::io)));
	ASSERT_EQ (2, ledgerstats::exit_code (ledgerstats::error (ledgerstats::error_transaction::missing_left)));
	ASSERT_EQ (3, ledgerstats::exit_code (ledgerstats::error (ledgerstats::error_validation::cyclic)));
	ASSERT_EQ (4, ledgerstats::exit_code (ledgerstats::error (ledgerstats::error_validation::disconnected)));
}
