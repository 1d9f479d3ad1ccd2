#include <politeia/lib/errors.hpp>
#include <politeia/lib/jsonconfig.hpp>
#include <politeia/lib/logger_mt.hpp>
#include <politeia/lib/utility.hpp>
#include <politeia/node/oracle.hpp>
#include <politeia/node/plugin.hpp>
#include <politeia/node/pluginconfig.hpp>
#include <politeia/node/record_store.hpp>
#include <politeia/node/write_lock.hpp>
#include <politeia/secure/identity.hpp>
#include <politeia/secure/utility.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <iterator>

namespace
{
std::string read_payload (boost::program_options::variables_map const & vm)
{
	std::string result;
	auto payload (vm.find ("payload"));
	if (payload != vm.end ())
	{
		result = payload->second.as<std::string> ();
	}
	else
	{
		result.assign (std::istreambuf_iterator<char> (std::cin), std::istreambuf_iterator<char> ());
	}
	return result;
}

int run (boost::filesystem::path const & data_path, politeia::dcr_networks network, boost::program_options::variables_map const & vm)
{
	auto result (1);
	boost::system::error_code error_chmod;
	boost::filesystem::create_directories (data_path);
	politeia::set_secure_perm_directory (data_path, error_chmod);

	politeia::plugin_config config (network);
	politeia::jsonconfig json;
	auto error (politeia::read_and_update_plugin_config (data_path, config, json));
	if (error)
	{
		std::cerr << "Error deserializing config: " << error.get_message () << std::endl;
		return result;
	}
	config.logging.init (data_path);
	politeia::logger_mt logger (config.logging.min_time_between_log_output);

	politeia::identity identity;
	error = identity.load_or_create (config.identity_path (data_path));
	if (error)
	{
		std::cerr << error.get_message () << std::endl;
		return result;
	}

	politeia::file_record_store records (politeia::decred_plugin::vetted_path (data_path));
	if (vm.count ("identity_public"))
	{
		std::cout << identity.public_key_hex () << std::endl;
		result = 0;
	}
	else if (vm.count ("publish_record"))
	{
		auto token (vm["publish_record"].as<std::string> ());
		error = records.set_status (token, politeia::file_record_store::status_public);
		if (!error)
		{
			std::cout << "Record " << token << " is public" << std::endl;
			result = 0;
		}
	}
	else if (vm.count ("command") || vm.count ("inventory"))
	{
		politeia::service_url url;
		if (url.parse (config.dcrdata_url))
		{
			std::cerr << "Invalid dcrdata URL: " << config.dcrdata_url << std::endl;
			return result;
		}
		politeia::dcrdata_oracle oracle (url, config.oracle_timeout, logger, config.logging.oracle_logging ());
		politeia::write_lock write_lock;
		politeia::plugin_registry registry;
		release_assert (!registry.add (std::make_shared<politeia::decred_plugin> (config, data_path, oracle, records, identity, write_lock, logger)));
		if (vm.count ("inventory"))
		{
			for (auto const & plugin : registry.inventory ())
			{
				std::cout << plugin->id () << " " << plugin->version () << "\n";
				for (auto const & setting : plugin->settings ())
				{
					std::cout << "\t" << setting.key << " = " << setting.value << "\n";
				}
			}
			result = 0;
		}
		else
		{
			std::string reply;
			error = registry.execute (vm["plugin"].as<std::string> (), vm["command"].as<std::string> (), read_payload (vm), reply);
			if (!error)
			{
				std::cout << reply << std::endl;
				result = 0;
			}
		}
		registry.stop ();
	}
	if (error)
	{
		std::cerr << error.get_message () << std::endl;
	}
	return result;
}
}

int main (int argc, char * const * argv)
{
	politeia::set_umask ();

	boost::program_options::options_description description ("Command line options");

	// clang-format off
	description.add_options ()
		("help", "Print out options")
		("data_path", boost::program_options::value<std::string> (), "Use the supplied path as the data directory")
		("network", boost::program_options::value<std::string> (), "Use the supplied network (mainnet, testnet or simnet)")
		("plugin", boost::program_options::value<std::string> ()->default_value (politeia::decred_plugin_constants::id), "Plugin the command is addressed to")
		("command", boost::program_options::value<std::string> (), "Execute a plugin command (startvote, castvotes or bestblock)")
		("payload", boost::program_options::value<std::string> (), "Command payload, read from standard input if omitted")
		("inventory", "List the registered plugins and their settings")
		("identity_public", "Print the public key votes are counter-signed with")
		("publish_record", boost::program_options::value<std::string> (), "Create the record with the supplied token or make it public")
		("generate_config", "Write the default configuration to standard output")
		("version", "Prints out version");
	// clang-format on

	boost::program_options::variables_map vm;
	try
	{
		boost::program_options::store (boost::program_options::parse_command_line (argc, argv, description), vm);
	}
	catch (boost::program_options::error const & err)
	{
		std::cerr << err.what () << std::endl;
		return 1;
	}
	boost::program_options::notify (vm);

	auto network (politeia::dcr_networks::mainnet);
	auto network_it (vm.find ("network"));
	if (network_it != vm.end () && politeia::network_params::parse (network_it->second.as<std::string> (), network))
	{
		std::cerr << "Invalid network. Valid values are mainnet, testnet and simnet." << std::endl;
		return 1;
	}

	auto data_path_it (vm.find ("data_path"));
	boost::filesystem::path data_path ((data_path_it != vm.end ()) ? boost::filesystem::path (data_path_it->second.as<std::string> ()) : politeia::working_path (network));
	auto result (1);
	if (vm.count ("help"))
	{
		std::cout << description << std::endl;
		result = 0;
	}
	else if (vm.count ("version"))
	{
		std::cout << "Version " << POLITEIA_VERSION_STRING << std::endl;
		result = 0;
	}
	else if (vm.count ("generate_config"))
	{
		politeia::plugin_config config (network);
		politeia::jsonconfig json;
		config.serialize_json (json);
		json.write (std::cout);
		result = 0;
	}
	else if (vm.count ("command") || vm.count ("inventory") || vm.count ("identity_public") || vm.count ("publish_record"))
	{
		try
		{
			result = run (data_path, network, vm);
		}
		catch (std::runtime_error const & e)
		{
			std::cerr << "Error while running plugin (" << e.what () << ")" << std::endl;
		}
	}
	else
	{
		std::cout << description << std::endl;
	}
	return result;
}
