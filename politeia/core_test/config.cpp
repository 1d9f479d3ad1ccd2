#include <politeia/lib/jsonconfig.hpp>
#include <politeia/node/pluginconfig.hpp>
#include <politeia/secure/utility.hpp>

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

namespace
{
void write_file (boost::filesystem::path const & path_a, std::string const & contents_a)
{
	boost::filesystem::create_directories (path_a.parent_path ());
	std::ofstream stream (path_a.string ());
	stream << contents_a;
}
}

TEST (plugin_config, defaults)
{
	politeia::plugin_config mainnet;
	ASSERT_EQ (politeia::dcr_networks::mainnet, mainnet.network);
	ASSERT_EQ ("https://dcrdata.org:443/", mainnet.dcrdata_url);
	ASSERT_EQ (256, mainnet.ticket_maturity);
	ASSERT_EQ (2016, mainnet.vote_duration);
	politeia::plugin_config testnet (politeia::dcr_networks::testnet);
	ASSERT_EQ ("https://testnet.dcrdata.org:443/", testnet.dcrdata_url);
	ASSERT_EQ (16, testnet.ticket_maturity);
	politeia::plugin_config simnet (politeia::dcr_networks::simnet);
	ASSERT_EQ ("http://127.0.0.1:7777/", simnet.dcrdata_url);
	ASSERT_EQ ("/data/identity.json", simnet.identity_path ("/data").string ());
	simnet.identity_file = "/keys/identity.json";
	ASSERT_EQ ("/keys/identity.json", simnet.identity_path ("/data").string ());
}

TEST (plugin_config, create_default_file)
{
	auto path (politeia::unique_path ());
	boost::filesystem::create_directories (path);
	politeia::plugin_config config (politeia::dcr_networks::testnet);
	politeia::jsonconfig json;
	ASSERT_FALSE (politeia::read_and_update_plugin_config (path, config, json));
	auto file (politeia::get_plugin_config_path (path));
	ASSERT_TRUE (boost::filesystem::exists (file));
	ASSERT_EQ (boost::filesystem::owner_read | boost::filesystem::owner_write, boost::filesystem::status (file).permissions ());
	politeia::plugin_config reread;
	politeia::jsonconfig json2;
	ASSERT_FALSE (politeia::read_and_update_plugin_config (path, reread, json2));
	ASSERT_EQ (politeia::dcr_networks::testnet, reread.network);
	ASSERT_EQ (config.dcrdata_url, reread.dcrdata_url);
	ASSERT_EQ (config.ticket_maturity, reread.ticket_maturity);
}

TEST (plugin_config, values)
{
	auto path (politeia::unique_path ());
	write_file (politeia::get_plugin_config_path (path), R"({
		"version": "1",
		"network": "simnet",
		"dcrdata_url": "http://localhost:17778/insight",
		"vote_duration": "10",
		"lock_timeout": "250",
		"identity_file": "id.json",
		"logging": { "vote": "true", "rotation_size": "1024" }
	})");
	politeia::plugin_config config;
	politeia::jsonconfig json;
	ASSERT_FALSE (politeia::read_and_update_plugin_config (path, config, json));
	ASSERT_EQ (politeia::dcr_networks::simnet, config.network);
	ASSERT_EQ (16, config.ticket_maturity);
	ASSERT_EQ ("http://localhost:17778/insight", config.dcrdata_url);
	ASSERT_EQ (10, config.vote_duration);
	ASSERT_EQ (std::chrono::milliseconds (250), config.lock_timeout);
	ASSERT_EQ (std::chrono::milliseconds (30000), config.oracle_timeout);
	ASSERT_EQ ("id.json", config.identity_file);
	ASSERT_TRUE (config.logging.vote_logging ());
	ASSERT_FALSE (config.logging.oracle_logging ());
	ASSERT_EQ (1024, config.logging.rotation_size);
}

TEST (plugin_config, invalid_values)
{
	auto check = [](std::string const & contents_a, std::string const & key_a) {
		auto path (politeia::unique_path ());
		write_file (politeia::get_plugin_config_path (path), contents_a);
		politeia::plugin_config config;
		politeia::jsonconfig json;
		auto error (politeia::read_and_update_plugin_config (path, config, json));
		ASSERT_EQ (politeia::error_config::invalid_value, error.get_code ());
		ASSERT_NE (std::string::npos, error.get_message ().find (key_a)) << error.get_message ();
	};
	check (R"({ "network": "regnet" })", "regnet");
	check (R"({ "vote_duration": "many" })", "vote_duration");
	check (R"({ "vote_duration": "0" })", "Vote duration");
	check (R"({ "dcrdata_url": "ftp://dcrdata.org" })", "ftp://dcrdata.org");
	check (R"({ "logging": { "vote": "yes" } })", "vote");
	check (R"({ "ticket_maturity": -1 })", "ticket_maturity");
	check (R"({ "vote_duration": "-1" })", "vote_duration");
	check (R"({ "ticket_maturity": 0 })", "Ticket maturity");
	check (R"({ "lock_timeout": -5 })", "Timeouts");
	check (R"({ "logging": { "max_size": "-1" } })", "max_size");
}

TEST (plugin_config, malformed_file)
{
	auto path (politeia::unique_path ());
	write_file (politeia::get_plugin_config_path (path), "{ \"network\": ");
	politeia::plugin_config config;
	politeia::jsonconfig json;
	ASSERT_TRUE (politeia::read_and_update_plugin_config (path, config, json));
}

TEST (plugin_config, upgrade_version)
{
	auto path (politeia::unique_path ());
	auto file (politeia::get_plugin_config_path (path));
	write_file (file, R"({ "version": "0", "network": "testnet" })");
	politeia::plugin_config config;
	politeia::jsonconfig json;
	ASSERT_FALSE (politeia::read_and_update_plugin_config (path, config, json));
	politeia::jsonconfig written;
	ASSERT_FALSE (written.read (file));
	unsigned version (0);
	std::string network;
	written.get_required<unsigned> ("version", version);
	written.get_required<std::string> ("network", network);
	ASSERT_FALSE (written.get_error ());
	ASSERT_EQ (1, version);
	ASSERT_EQ ("testnet", network);
}

TEST (jsonconfig, get_optional)
{
	politeia::jsonconfig json;
	json.put ("number", 7);
	json.put ("flag", true);
	json.put ("text", "abc");
	uint32_t number (0);
	json.get_optional<uint32_t> ("number", number);
	ASSERT_EQ (7, number);
	uint32_t missing (3);
	json.get_optional<uint32_t> ("missing", missing);
	ASSERT_EQ (3, missing);
	json.get_optional<uint32_t> ("missing", missing, 9);
	ASSERT_EQ (9, missing);
	auto flag (json.get_optional<bool> ("flag"));
	ASSERT_TRUE (flag);
	ASSERT_TRUE (*flag);
	ASSERT_FALSE (json.get_optional<std::string> ("absent"));
	ASSERT_FALSE (json.get_error ());
	uint32_t bad (0);
	json.get_required<uint32_t> ("text", bad);
	ASSERT_EQ (politeia::error_config::invalid_value, json.get_error ().get_code ());
}

TEST (jsonconfig, negative_unsigned)
{
	politeia::jsonconfig json;
	json.put ("count", -1);
	json.put ("offset", -1);
	int32_t offset (0);
	json.get_required<int32_t> ("offset", offset);
	ASSERT_FALSE (json.get_error ());
	ASSERT_EQ (-1, offset);
	uint32_t count (7);
	json.get_required<uint32_t> ("count", count);
	ASSERT_EQ (politeia::error_config::invalid_value, json.get_error ().get_code ());
	ASSERT_EQ (7, count);
}

TEST (jsonconfig, required_child)
{
	politeia::jsonconfig json;
	json.get_required_child ("node");
	ASSERT_EQ (politeia::error_config::missing_value, json.get_error ().get_code ());
}

TEST (jsonconfig, stream)
{
	politeia::jsonconfig json;
	json.put ("key", "value");
	std::stringstream stream;
	json.write (stream);
	politeia::jsonconfig read;
	read.read (stream);
	auto value (read.get_optional<std::string> ("key"));
	ASSERT_TRUE (value);
	ASSERT_EQ ("value", *value);
}
