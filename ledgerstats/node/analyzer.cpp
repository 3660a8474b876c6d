#include <ledgerstats/node/analyzer.hpp>
#include <ledgerstats/node/cli.hpp>
#include <ledgerstats/node/stats.hpp>
#include <ledgerstats/secure/validation.hpp>

#include <boost/format.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>

ledgerstats::analyzer::analyzer (ledgerstats::ledgerstats_config const & config_a, ledgerstats::logger_mt & logger_a) :
config (config_a),
logger (logger_a)
{
}

ledgerstats::error ledgerstats::analyzer::run (boost::filesystem::path const & input_a, std::ostream & output_a)
{
	ledgerstats::error result;
	logger.always_log ("Input file = ", input_a.string ());
	std::ifstream stream (input_a.string ());
	if (stream.is_open ())
	{
		result = run (stream, output_a);
	}
	else
	{
		result.set (boost::str (boost::format ("Error opening file `%1%`: %2%") % input_a.string () % std::strerror (errno)), ledgerstats::error_cli::input_unreadable);
		logger.log (ledgerstats::severity_level::error, result.get_message ());
	}
	return result;
}

ledgerstats::error ledgerstats::analyzer::run (std::istream & input_a, std::ostream & output_a)
{
	ledgerstats::error result;
	ledgerstats::graph graph (result, input_a);
	if (!result)
	{
		logger.always_log ("Loaded ", graph.size (), " transactions");
		if (config.logging.graph_logging ())
		{
			logger.always_log ("Graph:");
			for (auto const & transaction : graph.transactions ())
			{
				logger.always_log ("  ", transaction);
			}
		}
		if (config.validation)
		{
			result = validate (graph);
		}
		if (!result)
		{
			result = statistics (graph, output_a);
		}
	}
	else
	{
		logger.log (ledgerstats::severity_level::error, "Error reading graph: ", result.get_message ());
	}
	return result;
}

ledgerstats::error ledgerstats::analyzer::validate (ledgerstats::graph const & graph_a)
{
	ledgerstats::error result;
	auto connected_acyclic (ledgerstats::is_connected_acyclic (graph_a));
	result = ledgerstats::validation_error (connected_acyclic);
	if (!result)
	{
		if (config.logging.validation_logging ())
		{
			logger.always_log ("Graph is connected and acyclic");
			if (!ledgerstats::is_bipartite (graph_a))
			{
				logger.log (ledgerstats::severity_level::warning, "Graph is not bipartite, this should not be a problem");
			}
			else
			{
				logger.always_log ("Graph is bipartite");
			}
		}
	}
	else
	{
		logger.log (ledgerstats::severity_level::error, result.get_message ());
	}
	return result;
}

ledgerstats::error ledgerstats::analyzer::statistics (ledgerstats::graph const & graph_a, std::ostream & output_a)
{
	auto stats (ledgerstats::stat::make_default (graph_a));
	stats.collect ();
	auto result (stats.write (output_a));
	if (result)
	{
		logger.log (ledgerstats::severity_level::error, "Error calculating result: ", result.get_message ());
	}
	return result;
}
