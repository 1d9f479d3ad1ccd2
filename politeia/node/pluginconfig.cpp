#include <politeia/lib/jsonconfig.hpp>
#include <politeia/node/oracle.hpp>
#include <politeia/node/pluginconfig.hpp>

politeia::plugin_config::plugin_config (politeia::dcr_networks network_a) :
network (network_a)
{
	politeia::network_params params (network);
	dcrdata_url = params.default_dcrdata_url;
	ticket_maturity = params.ticket_maturity;
}

politeia::network_params politeia::plugin_config::network_params () const
{
	return politeia::network_params (network);
}

boost::filesystem::path politeia::plugin_config::identity_path (boost::filesystem::path const & data_path_a) const
{
	boost::filesystem::path result (identity_file);
	if (result.is_relative ())
	{
		result = data_path_a / result;
	}
	return result;
}

politeia::error politeia::plugin_config::serialize_json (politeia::jsonconfig & json) const
{
	json.put ("version", json_version ());
	json.put ("network", network_params ().name);
	json.put ("dcrdata_url", dcrdata_url);
	json.put ("ticket_maturity", ticket_maturity);
	json.put ("vote_duration", vote_duration);
	json.put ("lock_timeout", lock_timeout.count ());
	json.put ("oracle_timeout", oracle_timeout.count ());
	json.put ("identity_file", identity_file);

	politeia::jsonconfig logging_l;
	logging.serialize_json (logging_l);
	json.put_child ("logging", logging_l);
	return json.get_error ();
}

politeia::error politeia::plugin_config::deserialize_json (bool & upgraded_a, politeia::jsonconfig & json)
{
	try
	{
		if (!json.empty ())
		{
			unsigned version_l (json_version ());
			json.get_optional<unsigned> ("version", version_l);
			if (version_l < json_version ())
			{
				json.put ("version", json_version ());
				upgraded_a = true;
			}

			auto network_l (json.get_optional<std::string> ("network"));
			if (network_l)
			{
				politeia::dcr_networks parsed;
				if (politeia::network_params::parse (*network_l, parsed))
				{
					json.get_error ().set ("Unknown network: " + *network_l, politeia::error_config::invalid_value);
				}
				else if (parsed != network)
				{
					*this = plugin_config (parsed);
				}
			}

			json.get_optional<std::string> ("dcrdata_url", dcrdata_url);
			politeia::service_url url;
			if (!json.get_error () && url.parse (dcrdata_url))
			{
				json.get_error ().set ("Invalid dcrdata URL: " + dcrdata_url, politeia::error_config::invalid_value);
			}
			json.get_optional<uint32_t> ("ticket_maturity", ticket_maturity);
			if (!json.get_error () && ticket_maturity == 0)
			{
				json.get_error ().set ("Ticket maturity must be at least one block", politeia::error_config::invalid_value);
			}
			json.get_optional<uint32_t> ("vote_duration", vote_duration);
			if (!json.get_error () && vote_duration == 0)
			{
				json.get_error ().set ("Vote duration must be at least one block", politeia::error_config::invalid_value);
			}
			auto lock_timeout_l (lock_timeout.count ());
			json.get_optional<decltype (lock_timeout_l)> ("lock_timeout", lock_timeout_l);
			lock_timeout = std::chrono::milliseconds (lock_timeout_l);
			auto oracle_timeout_l (oracle_timeout.count ());
			json.get_optional<decltype (oracle_timeout_l)> ("oracle_timeout", oracle_timeout_l);
			oracle_timeout = std::chrono::milliseconds (oracle_timeout_l);
			if (!json.get_error () && (lock_timeout_l <= 0 || oracle_timeout_l <= 0))
			{
				json.get_error ().set ("Timeouts must be positive", politeia::error_config::invalid_value);
			}
			json.get_optional<std::string> ("identity_file", identity_file);

			auto logging_l (json.get_optional_child ("logging"));
			if (!json.get_error () && logging_l)
			{
				logging.deserialize_json (*logging_l);
			}
		}
	}
	catch (std::runtime_error const & ex)
	{
		json.get_error () = ex;
	}
	return json.get_error ();
}

boost::filesystem::path politeia::get_plugin_config_path (boost::filesystem::path const & data_path)
{
	return data_path / "config-plugin.json";
}

politeia::error politeia::read_and_update_plugin_config (boost::filesystem::path const & data_path, politeia::plugin_config & config_a, politeia::jsonconfig & json_a)
{
	boost::system::error_code error_chmod;
	auto config_path = politeia::get_plugin_config_path (data_path);
	auto error (json_a.read_and_update (config_a, config_path));
	politeia::set_secure_perm_file (config_path, error_chmod);
	return error;
}
