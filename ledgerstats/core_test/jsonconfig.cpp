#include <gtest/gtest.h>

#include <ledgerstats/lib/jsonconfig.hpp>
#include <ledgerstats/node/ledgerstats_config.hpp>
#include <ledgerstats/secure/utility.hpp>

#include <fstream>
#include <sstream>

namespace
{
void write_file (boost::filesystem::path const & path_a, std::string const & contents_a)
{
	std::ofstream stream (path_a.string ());
	stream << contents_a;
}
}

TEST (jsonconfig, get_optional)
{
	ledgerstats::jsonconfig json;
	json.put ("number", 5).put ("flag", true).put ("text", std::string ("value"));
	uint64_t number (0);
	bool flag (false);
	std::string text;
	int absent (3);
	json.get_optional<uint64_t> ("number", number);
	json.get_optional<bool> ("flag", flag);
	json.get_optional<std::string> ("text", text);
	json.get_optional<int> ("absent", absent);
	ASSERT_FALSE (json.get_error ());
	ASSERT_EQ (5, number);
	ASSERT_TRUE (flag);
	ASSERT_EQ ("value", text);
	ASSERT_EQ (3, absent);
	ASSERT_FALSE (json.get_optional<int> ("absent").is_initialized ());
	ASSERT_EQ (5, json.get_optional<int> ("number").get ());
}

TEST (jsonconfig, get_required)
{
	ledgerstats::jsonconfig json;
	uint64_t count (0);
	json.get_required<uint64_t> ("count", count);
	ASSERT_EQ (ledgerstats::error_config::missing_value, json.get_error ().error_code ());
	ASSERT_EQ ("count is required and must be of type an unsigned integer", json.get_error ().get_message ());
}

TEST (jsonconfig, invalid_value)
{
	ledgerstats::jsonconfig json;
	json.put ("flag", std::string ("maybe"));
	bool flag (false);
	json.get_optional<bool> ("flag", flag);
	ASSERT_EQ (ledgerstats::error_config::invalid_value, json.get_error ().error_code ());
	ASSERT_EQ ("flag is not of type a boolean", json.get_error ().get_message ());
	// The first error is kept
	uint64_t number (0);
	json.put ("number", std::string ("-1"));
	json.get_optional<uint64_t> ("number", number);
	ASSERT_EQ ("flag is not of type a boolean", json.get_error ().get_message ());
}

TEST (jsonconfig, children)
{
	ledgerstats::jsonconfig json;
	ledgerstats::jsonconfig child;
	child.put ("level", std::string ("debug"));
	json.put_child ("logging", child);
	ASSERT_FALSE (json.get_optional_child ("missing"));
	auto logging_l (json.get_optional_child ("logging"));
	ASSERT_TRUE (logging_l);
	std::string level;
	logging_l->get<std::string> ("level", level);
	ASSERT_EQ ("debug", level);
	json.get_required_child ("other");
	ASSERT_EQ (ledgerstats::error_config::missing_value, json.get_error ().error_code ());
	ASSERT_EQ ("Missing configuration node: other", json.get_error ().get_message ());
}

TEST (jsonconfig, stream)
{
	ledgerstats::jsonconfig json;
	json.put ("validation", false);
	std::stringstream stream;
	json.write (stream);
	ledgerstats::jsonconfig json2;
	json2.read (stream);
	ASSERT_TRUE (json2.has_key ("validation"));
	bool validation (true);
	json2.get<bool> ("validation", validation);
	ASSERT_FALSE (validation);
	json2.erase ("validation");
	ASSERT_FALSE (json2.has_key ("validation"));
	ASSERT_TRUE (json2.empty ());
}

TEST (config, defaults)
{
	ledgerstats::ledgerstats_config config;
	ASSERT_TRUE (config.validation);
	ASSERT_TRUE (config.logging.log_to_cerr ());
	ASSERT_FALSE (config.logging.graph_logging ());
	ASSERT_TRUE (config.logging.validation_logging ());
	ASSERT_EQ (ledgerstats::severity_level::info, config.logging.min_level ());
	ASSERT_TRUE (config.logging.log_file.empty ());
}

TEST (config, create_missing_file)
{
	auto path (ledgerstats::unique_path ());
	ledgerstats::ledgerstats_config config;
	auto error (ledgerstats::read_and_update_ledgerstats_config (path, config));
	ASSERT_FALSE (error);
	ASSERT_TRUE (boost::filesystem::exists (path));
	ledgerstats::jsonconfig json;
	std::ifstream stream (path.string ());
	json.read (stream);
	std::string level;
	auto logging_l (json.get_optional_child ("logging"));
	ASSERT_TRUE (logging_l);
	logging_l->get<std::string> ("level", level);
	ASSERT_EQ ("info", level);
	bool validation (false);
	json.get<bool> ("validation", validation);
	ASSERT_TRUE (validation);
	int version (0);
	json.get<int> ("version", version);
	ASSERT_EQ (config.json_version (), version);
}

TEST (config, read_values)
{
	auto path (ledgerstats::unique_path ());
	write_file (path, R"({ "version": "1", "validation": "false", "logging": { "version": "1", "level": "debug", "graph_logging": "true", "log_to_cerr": "false", "log_file": "ledgerstats.log" } })");
	ledgerstats::ledgerstats_config config;
	auto error (ledgerstats::read_and_update_ledgerstats_config (path, config));
	ASSERT_FALSE (error);
	ASSERT_FALSE (config.validation);
	ASSERT_TRUE (config.logging.graph_logging ());
	ASSERT_FALSE (config.logging.log_to_cerr ());
	ASSERT_EQ (ledgerstats::severity_level::debug, config.logging.min_level ());
	ASSERT_EQ ("ledgerstats.log", config.logging.log_file.string ());
}

TEST (config, upgrade_missing_logging)
{
	auto path (ledgerstats::unique_path ());
	write_file (path, R"({ "version": "1", "validation": "false" })");
	ledgerstats::ledgerstats_config config;
	auto error (ledgerstats::read_and_update_ledgerstats_config (path, config));
	ASSERT_FALSE (error);
	ASSERT_FALSE (config.validation);
	// The defaults were written back
	ledgerstats::jsonconfig json;
	std::ifstream stream (path.string ());
	json.read (stream);
	ASSERT_TRUE (json.get_optional_child ("logging"));
}

TEST (config, unknown_version)
{
	auto path (ledgerstats::unique_path ());
	write_file (path, R"({ "version": "2", "validation": "true", "logging": {} })");
	ledgerstats::ledgerstats_config config;
	auto error (ledgerstats::read_and_update_ledgerstats_config (path, config));
	ASSERT_EQ (ledgerstats::error_common::exception, error.error_code ());
	ASSERT_EQ ("Unknown ledgerstats_config version", error.get_message ());
}

TEST (config, invalid_level)
{
	auto path (ledgerstats::unique_path ());
	write_file (path, R"({ "version": "1", "logging": { "level": "loud" } })");
	ledgerstats::ledgerstats_config config;
	auto error (ledgerstats::read_and_update_ledgerstats_config (path, config));
	ASSERT_EQ (ledgerstats::error_config::invalid_value, error.error_code ());
}

TEST (config, invalid_type)
{
	auto path (ledgerstats::unique_path ());
	write_file (path, R"({ "version": "1", "validation": "yes", "logging": {} })");
	ledgerstats::ledgerstats_config config;
	auto error (ledgerstats::read_and_update_ledgerstats_config (path, config));
	ASSERT_EQ (ledgerstats::error_config::invalid_value, error.error_code ());
	ASSERT_EQ ("validation is not of type a boolean", error.get_message ());
}

TEST (config, malformed)
{
	auto path (ledgerstats::unique_path ());
	write_file (path, "{ \"version\": ");
	ledgerstats::ledgerstats_config config;
	auto error (ledgerstats::read_and_update_ledgerstats_config (path, config));
	ASSERT_TRUE (error);
}

TEST (config, parse_severity)
{
	ledgerstats::severity_level level (ledgerstats::severity_level::info);
	ASSERT_FALSE (ledgerstats::parse_severity ("warning", level));
	ASSERT_EQ (ledgerstats::severity_level::warning, level);
	ASSERT_TRUE (ledgerstats::parse_severity ("WARNING", level));
	ASSERT_TRUE (ledgerstats::parse_severity ("", level));
	ASSERT_EQ (ledgerstats::severity_level::warning, level);
}
