#pragma once

#include <politeia/lib/errors.hpp>
#include <politeia/node/logging.hpp>
#include <politeia/node/snapshot.hpp>
#include <politeia/node/vote_intake.hpp>
#include <politeia/node/vote_session.hpp>

#include <boost/filesystem/path.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace politeia
{
class blockchain_oracle;
class identity;
class logger_mt;
class plugin_config;
class record_store;
class write_lock;

class plugin_setting final
{
public:
	std::string key;
	std::string value;
};

/** A backend extension answering commands addressed to its id */
class plugin
{
public:
	virtual ~plugin () = default;
	virtual std::string id () const = 0;
	virtual std::string version () const = 0;
	virtual std::vector<politeia::plugin_setting> settings () const = 0;
	/** @return error_plugin::unknown_command if \p command_a is not supported */
	virtual politeia::error execute (std::string const & command_a, std::string const & payload_a, std::string & reply_a) = 0;
	/** No command started after this returns mutates state */
	virtual void stop () = 0;
};

/** Routes commands to plugins by id */
class plugin_registry final
{
public:
	/** @return true if a plugin with the same id is already registered */
	bool add (std::shared_ptr<politeia::plugin> const & plugin_a);
	/** @return error_plugin::unknown_plugin if no plugin has id \p plugin_id_a */
	politeia::error execute (std::string const & plugin_id_a, std::string const & command_a, std::string const & payload_a, std::string & reply_a);
	std::shared_ptr<politeia::plugin> find (std::string const & plugin_id_a);
	/** Registered plugins ordered by id */
	std::vector<std::shared_ptr<politeia::plugin>> inventory ();
	void stop ();

private:
	std::mutex mutex;
	std::map<std::string, std::shared_ptr<politeia::plugin>> plugins;
};

/** Blockchain anchored proposal voting */
class decred_plugin final : public plugin
{
public:
	decred_plugin (politeia::plugin_config const & config_a, boost::filesystem::path const & data_path_a, politeia::blockchain_oracle & oracle_a, politeia::record_store & records_a, politeia::identity const & identity_a, politeia::write_lock & write_lock_a, politeia::logger_mt & logger_a);
	std::string id () const override;
	std::string version () const override;
	std::vector<politeia::plugin_setting> settings () const override;
	politeia::error execute (std::string const & command_a, std::string const & payload_a, std::string & reply_a) override;
	void stop () override;

	politeia::error on_start_vote (std::string const & payload_a, std::string & reply_a);
	politeia::error on_cast_votes (std::string const & payload_a, std::string & reply_a);
	/** Replies with the best block height in decimal */
	politeia::error on_best_block (std::string const & payload_a, std::string & reply_a);

	/** Returns a mapping from command names to handler functions */
	static auto handler_map () -> std::unordered_map<std::string, std::function<politeia::error (decred_plugin *, std::string const &, std::string &)>>;

	static boost::filesystem::path vetted_path (boost::filesystem::path const & data_path_a);

private:
	std::string dcrdata_url;
	politeia::logging logging;
	politeia::blockchain_oracle & oracle;
	politeia::write_lock & write_lock;
	politeia::snapshotter snapshotter;
	politeia::vote_session_manager sessions;
	politeia::vote_intake intake;
};
}
