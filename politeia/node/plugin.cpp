#include <politeia/node/oracle.hpp>
#include <politeia/node/plugin.hpp>
#include <politeia/node/pluginconfig.hpp>
#include <politeia/node/write_lock.hpp>

bool politeia::plugin_registry::add (std::shared_ptr<politeia::plugin> const & plugin_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	return !plugins.emplace (plugin_a->id (), plugin_a).second;
}

std::shared_ptr<politeia::plugin> politeia::plugin_registry::find (std::string const & plugin_id_a)
{
	std::shared_ptr<politeia::plugin> result;
	std::lock_guard<std::mutex> lock (mutex);
	auto existing (plugins.find (plugin_id_a));
	if (existing != plugins.end ())
	{
		result = existing->second;
	}
	return result;
}

politeia::error politeia::plugin_registry::execute (std::string const & plugin_id_a, std::string const & command_a, std::string const & payload_a, std::string & reply_a)
{
	politeia::error result;
	auto plugin (find (plugin_id_a));
	if (plugin != nullptr)
	{
		result = plugin->execute (command_a, payload_a, reply_a);
	}
	else
	{
		result.set ("Unknown plugin: " + plugin_id_a, politeia::error_plugin::unknown_plugin);
	}
	return result;
}

std::vector<std::shared_ptr<politeia::plugin>> politeia::plugin_registry::inventory ()
{
	std::vector<std::shared_ptr<politeia::plugin>> result;
	std::lock_guard<std::mutex> lock (mutex);
	for (auto const & plugin : plugins)
	{
		result.push_back (plugin.second);
	}
	return result;
}

void politeia::plugin_registry::stop ()
{
	for (auto const & plugin : inventory ())
	{
		plugin->stop ();
	}
}

/**
 * Mapping from command name to handler function.
 * @note This must be updated whenever a new command is added to decred_plugin_constants.
 */
auto politeia::decred_plugin::handler_map () -> std::unordered_map<std::string, std::function<politeia::error (politeia::decred_plugin *, std::string const &, std::string &)>>
{
	static std::unordered_map<std::string, std::function<politeia::error (politeia::decred_plugin *, std::string const &, std::string &)>> handlers;
	static std::once_flag initialized;
	std::call_once (initialized, [] {
		handlers.emplace (politeia::decred_plugin_constants::cmd_start_vote, &politeia::decred_plugin::on_start_vote);
		handlers.emplace (politeia::decred_plugin_constants::cmd_cast_votes, &politeia::decred_plugin::on_cast_votes);
		handlers.emplace (politeia::decred_plugin_constants::cmd_best_block, &politeia::decred_plugin::on_best_block);
	});
	return handlers;
}

boost::filesystem::path politeia::decred_plugin::vetted_path (boost::filesystem::path const & data_path_a)
{
	return data_path_a / "vetted";
}

politeia::decred_plugin::decred_plugin (politeia::plugin_config const & config_a, boost::filesystem::path const & data_path_a, politeia::blockchain_oracle & oracle_a, politeia::record_store & records_a, politeia::identity const & identity_a, politeia::write_lock & write_lock_a, politeia::logger_mt & logger_a) :
dcrdata_url (config_a.dcrdata_url),
logging (config_a.logging),
oracle (oracle_a),
write_lock (write_lock_a),
snapshotter (oracle_a, logger_a),
sessions (records_a, snapshotter, write_lock_a, logger_a, config_a.ticket_maturity, config_a.vote_duration, config_a.lock_timeout),
intake (oracle_a, config_a.network_params (), identity_a, write_lock_a, vetted_path (data_path_a), logger_a, logging, config_a.lock_timeout)
{
}

std::string politeia::decred_plugin::id () const
{
	return politeia::decred_plugin_constants::id;
}

std::string politeia::decred_plugin::version () const
{
	return politeia::decred_plugin_constants::version;
}

std::vector<politeia::plugin_setting> politeia::decred_plugin::settings () const
{
	return { { "dcrdata", dcrdata_url } };
}

politeia::error politeia::decred_plugin::execute (std::string const & command_a, std::string const & payload_a, std::string & reply_a)
{
	politeia::error result;
	auto handlers (handler_map ());
	auto handler (handlers.find (command_a));
	if (handler != handlers.end ())
	{
		result = handler->second (this, payload_a, reply_a);
	}
	else
	{
		result.set ("Unknown command: " + command_a, politeia::error_plugin::unknown_command);
	}
	return result;
}

void politeia::decred_plugin::stop ()
{
	write_lock.stop ();
}

politeia::error politeia::decred_plugin::on_start_vote (std::string const & payload_a, std::string & reply_a)
{
	return sessions.start_vote (payload_a, reply_a);
}

politeia::error politeia::decred_plugin::on_cast_votes (std::string const & payload_a, std::string & reply_a)
{
	return intake.cast_votes (payload_a, reply_a);
}

politeia::error politeia::decred_plugin::on_best_block (std::string const &, std::string & reply_a)
{
	politeia::block_info best;
	auto result (oracle.best_block (best));
	if (!result)
	{
		reply_a = std::to_string (best.height);
	}
	return result;
}
