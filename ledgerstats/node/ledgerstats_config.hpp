#pragma once

#include <ledgerstats/lib/errors.hpp>
#include <ledgerstats/lib/jsonconfig.hpp>
#include <ledgerstats/node/logging.hpp>

#include <boost/filesystem.hpp>

namespace ledgerstats
{
class ledgerstats_config
{
public:
	ledgerstats::error deserialize_json (bool &, ledgerstats::jsonconfig &);
	ledgerstats::error serialize_json (ledgerstats::jsonconfig &) const;
	/**
	 * Returns true if an upgrade occurred
	 * @param version The version to upgrade to.
	 * @param config Configuration to upgrade.
	 */
	bool upgrade_json (unsigned version, ledgerstats::jsonconfig & config);
	// Run the structural validators before computing statistics
	bool validation{ true };
	ledgerstats::logging logging;
	int json_version () const
	{
		return 1;
	}
};

/** Reads the configuration at \p config_path_a, writing defaults for anything missing back to the file */
ledgerstats::error read_and_update_ledgerstats_config (boost::filesystem::path const & config_path_a, ledgerstats::ledgerstats_config & config_a);
}
