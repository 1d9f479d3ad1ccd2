#pragma once

#include <politeia/lib/errors.hpp>
#include <politeia/node/logging.hpp>
#include <politeia/secure/network.hpp>

#include <boost/filesystem/path.hpp>

#include <chrono>
#include <string>

namespace politeia
{
class jsonconfig;

/** Configuration of the decred plugin, persisted as config-plugin.json in the data path */
class plugin_config final
{
public:
	explicit plugin_config (politeia::dcr_networks network_a = politeia::dcr_networks::mainnet);
	politeia::error serialize_json (politeia::jsonconfig &) const;
	politeia::error deserialize_json (bool & upgraded_a, politeia::jsonconfig &);
	politeia::network_params network_params () const;
	/** Identity file, relative paths are resolved against \p data_path_a */
	boost::filesystem::path identity_path (boost::filesystem::path const & data_path_a) const;
	unsigned json_version () const
	{
		return 1;
	}

	politeia::dcr_networks network;
	std::string dcrdata_url;
	uint32_t ticket_maturity;
	/** Blocks a vote stays open after its snapshot block */
	uint32_t vote_duration{ 2016 };
	std::chrono::milliseconds lock_timeout{ 10000 };
	std::chrono::milliseconds oracle_timeout{ 30000 };
	std::string identity_file{ "identity.json" };
	politeia::logging logging;
};

boost::filesystem::path get_plugin_config_path (boost::filesystem::path const & data_path);
politeia::error read_and_update_plugin_config (boost::filesystem::path const & data_path, politeia::plugin_config & config_a, politeia::jsonconfig & json_a);
}
