#pragma once

#include <ledgerstats/lib/errors.hpp>
#include <ledgerstats/node/ledgerstats_config.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

namespace ledgerstats
{
/** Command line related error codes */
enum class error_cli
{
	generic = 1,
	parse_error = 2,
	invalid_arguments = 3,
	unknown_command = 4,
	missing_input = 5,
	input_unreadable = 6
};

void add_options (boost::program_options::options_description &, boost::program_options::positional_options_description &);
/**
 * Load the configuration named by --config, apply the flags overriding it and extract the input path.
 * @return error_cli::unknown_command when help was requested
 */
ledgerstats::error handle_options (boost::program_options::variables_map const &, ledgerstats::ledgerstats_config &, boost::filesystem::path &);
/** 0 for success, 1 for an input that can't be opened or failed statistics, 2 for a malformed or unreadable graph, 3 for a cycle, 4 for an unconnected graph */
int exit_code (ledgerstats::error const &);
}

REGISTER_ERROR_CODES (ledgerstats, error_cli)
