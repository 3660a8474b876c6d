#include <ledgerstats/node/ledgerstats_config.hpp>

ledgerstats::error ledgerstats::ledgerstats_config::serialize_json (ledgerstats::jsonconfig & json) const
{
	json.put ("version", json_version ());
	json.put ("validation", validation);

	ledgerstats::jsonconfig logging_l;
	logging.serialize_json (logging_l);
	json.put_child ("logging", logging_l);
	return json.get_error ();
}

ledgerstats::error ledgerstats::ledgerstats_config::deserialize_json (bool & upgraded_a, ledgerstats::jsonconfig & json)
{
	try
	{
		if (!json.empty ())
		{
			int version_l (json_version ());
			if (!json.has_key ("version"))
			{
				upgraded_a = true;
			}
			json.get_optional<int> ("version", version_l);

			upgraded_a |= upgrade_json (version_l, json);

			json.get_optional<bool> ("validation", validation);

			auto logging_l (json.get_required_child ("logging"));
			if (!json.get_error ())
			{
				logging.deserialize_json (upgraded_a, logging_l);
			}
		}
		else
		{
			upgraded_a = true;
			serialize_json (json);
		}
	}
	catch (std::runtime_error const & ex)
	{
		json.get_error () = ex;
	}
	return json.get_error ();
}

bool ledgerstats::ledgerstats_config::upgrade_json (unsigned version_a, ledgerstats::jsonconfig & json)
{
	json.put ("version", json_version ());
	switch (version_a)
	{
		case 1:
		{
			auto logging_l (json.get_optional_child ("logging"));
			if (!logging_l)
			{
				ledgerstats::jsonconfig logging_defaults_l;
				logging.serialize_json (logging_defaults_l);
				json.put_child ("logging", logging_defaults_l);
				return true;
			}
			break;
		}
		default:
			throw std::runtime_error ("Unknown ledgerstats_config version");
	}
	return version_a < static_cast<unsigned> (json_version ());
}

namespace ledgerstats
{
ledgerstats::error read_and_update_ledgerstats_config (boost::filesystem::path const & config_path_a, ledgerstats::ledgerstats_config & config_a)
{
	ledgerstats::jsonconfig json;
	return json.read_and_update (config_a, config_path_a);
}
}
