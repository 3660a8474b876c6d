#include <ledgerstats/node/logging.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

#include <array>
#include <atomic>
#include <iostream>
#include <utility>

namespace
{
std::array<std::pair<char const *, ledgerstats::severity_level>, 6> const severity_names{ { { "trace", ledgerstats::severity_level::trace },
{ "debug", ledgerstats::severity_level::debug },
{ "info", ledgerstats::severity_level::info },
{ "warning", ledgerstats::severity_level::warning },
{ "error", ledgerstats::severity_level::error },
{ "fatal", ledgerstats::severity_level::fatal } } };

char const * const log_format = "[%TimeStamp%] [%Severity%]: %Message%";
}

bool ledgerstats::parse_severity (std::string const & text_a, ledgerstats::severity_level & level_a)
{
	auto error (true);
	for (auto const & entry : severity_names)
	{
		if (text_a == entry.first)
		{
			level_a = entry.second;
			error = false;
		}
	}
	return error;
}

ledgerstats::error ledgerstats::logging::serialize_json (ledgerstats::jsonconfig & json) const
{
	json.put ("version", json_version ());
	json.put ("graph_logging", graph_logging_value);
	json.put ("validation_logging", validation_logging_value);
	json.put ("log_to_cerr", log_to_cerr_value);
	json.put ("flush", flush);
	json.put ("level", level);
	json.put ("log_file", log_file.string ());
	return json.get_error ();
}

ledgerstats::error ledgerstats::logging::deserialize_json (bool & upgraded_a, ledgerstats::jsonconfig & json)
{
	int version_l (json_version ());
	if (!json.has_key ("version"))
	{
		json.put ("version", json_version ());
		upgraded_a = true;
	}
	json.get_optional<int> ("version", version_l);
	if (version_l > json_version ())
	{
		json.get_error ().set ("Unknown logging configuration version", ledgerstats::error_config::invalid_value);
	}
	json.get_optional<bool> ("graph_logging", graph_logging_value);
	json.get_optional<bool> ("validation_logging", validation_logging_value);
	json.get_optional<bool> ("log_to_cerr", log_to_cerr_value);
	json.get_optional<bool> ("flush", flush);
	json.get_optional<std::string> ("level", level);
	std::string log_file_l (log_file.string ());
	json.get_optional<std::string> ("log_file", log_file_l);
	log_file = log_file_l;
	ledgerstats::severity_level level_l;
	if (!json.get_error () && ledgerstats::parse_severity (level, level_l))
	{
		json.get_error ().set ("level must be one of trace, debug, info, warning, error or fatal", ledgerstats::error_config::invalid_value);
	}
	return json.get_error ();
}

bool ledgerstats::logging::graph_logging () const
{
	return graph_logging_value;
}

bool ledgerstats::logging::validation_logging () const
{
	return validation_logging_value;
}

bool ledgerstats::logging::log_to_cerr () const
{
	return log_to_cerr_value;
}

ledgerstats::severity_level ledgerstats::logging::min_level () const
{
	auto result (ledgerstats::severity_level::info);
	auto error (ledgerstats::parse_severity (level, result));
	return error ? ledgerstats::severity_level::info : result;
}

void ledgerstats::logging::init ()
{
	static std::atomic_flag logging_already_added = ATOMIC_FLAG_INIT;
	if (!logging_already_added.test_and_set ())
	{
		boost::log::add_common_attributes ();
		boost::log::register_simple_formatter_factory<ledgerstats::severity_level, char> ("Severity");
		if (log_to_cerr ())
		{
			boost::log::add_console_log (std::cerr, boost::log::keywords::format = log_format);
		}
		if (!log_file.empty ())
		{
			boost::log::add_file_log (boost::log::keywords::file_name = log_file.string (), boost::log::keywords::open_mode = std::ios_base::app, boost::log::keywords::auto_flush = flush, boost::log::keywords::format = log_format);
		}
		if (!log_to_cerr () && log_file.empty ())
		{
			// Without sinks boost::log falls back to printing everything to the console
			boost::log::core::get ()->set_logging_enabled (false);
		}
		boost::log::core::get ()->set_filter (boost::log::trivial::severity >= min_level ());
	}
}
