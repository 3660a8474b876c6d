#pragma once

#include <ledgerstats/lib/errors.hpp>
#include <ledgerstats/lib/jsonconfig.hpp>
#include <ledgerstats/lib/logger_mt.hpp>

#include <boost/filesystem.hpp>

#include <string>

namespace ledgerstats
{
class logging final
{
public:
	ledgerstats::error serialize_json (ledgerstats::jsonconfig &) const;
	ledgerstats::error deserialize_json (bool &, ledgerstats::jsonconfig &);
	bool graph_logging () const;
	bool validation_logging () const;
	bool log_to_cerr () const;
	/** Installs the sinks and the severity filter, only the first call per process has an effect */
	void init ();
	ledgerstats::severity_level min_level () const;
	bool graph_logging_value{ false };
	bool validation_logging_value{ true };
	bool log_to_cerr_value{ true };
	bool flush{ true };
	std::string level{ "info" };
	// Empty for no file sink
	boost::filesystem::path log_file;
	int json_version () const
	{
		return 1;
	}
};

/** Parse trace, debug, info, warning, error or fatal */
bool parse_severity (std::string const &, ledgerstats::severity_level &);
}
