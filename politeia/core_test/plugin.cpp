#include <politeia/core_test/testutil.hpp>
#include <politeia/lib/logger_mt.hpp>
#include <politeia/node/plugin.hpp>
#include <politeia/node/pluginconfig.hpp>
#include <politeia/node/write_lock.hpp>
#include <politeia/secure/identity.hpp>
#include <politeia/secure/utility.hpp>

#include <boost/filesystem/operations.hpp>

#include <gtest/gtest.h>

namespace
{
class plugin_context
{
public:
	plugin_context () :
	config (politeia::dcr_networks::simnet),
	data_path (politeia::unique_path ()),
	oracle (500),
	identity (politeia::identity::generate ()),
	plugin (std::make_shared<politeia::decred_plugin> (config, data_path, oracle, records, identity, write_lock, logger))
	{
	}
	politeia::plugin_config config;
	boost::filesystem::path data_path;
	politeia::memory_oracle oracle;
	politeia::memory_record_store records;
	politeia::identity identity;
	politeia::write_lock write_lock;
	politeia::logger_mt logger;
	std::shared_ptr<politeia::decred_plugin> plugin;
};

class echo_plugin final : public politeia::plugin
{
public:
	std::string id () const override
	{
		return "echo";
	}
	std::string version () const override
	{
		return "2";
	}
	std::vector<politeia::plugin_setting> settings () const override
	{
		return {};
	}
	politeia::error execute (std::string const & command_a, std::string const & payload_a, std::string & reply_a) override
	{
		reply_a = command_a + ":" + payload_a;
		return politeia::error ();
	}
	void stop () override
	{
		stopped = true;
	}
	bool stopped{ false };
};
}

TEST (plugin_registry, routing)
{
	plugin_context context;
	politeia::plugin_registry registry;
	auto echo (std::make_shared<echo_plugin> ());
	ASSERT_FALSE (registry.add (context.plugin));
	ASSERT_FALSE (registry.add (echo));
	ASSERT_TRUE (registry.add (std::make_shared<echo_plugin> ()));
	std::string reply;
	ASSERT_FALSE (registry.execute ("echo", "ping", "payload", reply));
	ASSERT_EQ ("ping:payload", reply);
	ASSERT_FALSE (registry.execute ("decred", "bestblock", "", reply));
	ASSERT_EQ ("500", reply);
	ASSERT_EQ (politeia::error_plugin::unknown_plugin, registry.execute ("cms", "ping", "", reply).get_code ());
	auto inventory (registry.inventory ());
	ASSERT_EQ (2, inventory.size ());
	ASSERT_EQ ("decred", inventory[0]->id ());
	ASSERT_EQ ("echo", inventory[1]->id ());
	ASSERT_EQ (nullptr, registry.find ("cms"));
	registry.stop ();
	ASSERT_TRUE (echo->stopped);
	ASSERT_TRUE (context.write_lock.stopped ());
}

TEST (decred_plugin, identity)
{
	plugin_context context;
	ASSERT_EQ ("decred", context.plugin->id ());
	ASSERT_EQ ("1", context.plugin->version ());
	auto settings (context.plugin->settings ());
	ASSERT_EQ (1, settings.size ());
	ASSERT_EQ ("dcrdata", settings[0].key);
	ASSERT_EQ ("http://127.0.0.1:7777/", settings[0].value);
}

TEST (decred_plugin, unknown_command)
{
	plugin_context context;
	std::string reply;
	ASSERT_EQ (politeia::error_plugin::unknown_command, context.plugin->execute ("tally", "", reply).get_code ());
	ASSERT_TRUE (reply.empty ());
}

TEST (decred_plugin, best_block_unavailable)
{
	plugin_context context;
	context.oracle.unavailable = true;
	std::string reply;
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, context.plugin->execute ("bestblock", "", reply).get_code ());
}

TEST (decred_plugin, start_and_cast)
{
	plugin_context context;
	auto token (politeia::test_hash (77));
	context.records.add (token);
	boost::filesystem::create_directories (politeia::decred_plugin::vetted_path (context.data_path) / token);
	auto ticket (politeia::test_hash (7700));
	context.oracle.set_pool (500 - 16, { ticket });
	auto key (politeia::private_key::generate ());
	context.oracle.set_commitment (ticket, key.address (context.config.network_params ()).to_string ());
	std::string reply;
	politeia::vote_request request;
	request.token = token;
	request.mask = 0x3;
	request.options.push_back ({ "no", "Don't approve proposal", 0x1 });
	request.options.push_back ({ "yes", "Approve proposal", 0x2 });
	ASSERT_FALSE (context.plugin->execute ("startvote", politeia::encode_vote_request (request), reply));
	politeia::start_vote_reply started;
	ASSERT_FALSE (politeia::decode_start_vote_reply (reply, started));
	ASSERT_EQ (484, started.start_block_height);
	ASSERT_EQ (484 + 2016, started.end_height);
	ASSERT_EQ (std::vector<std::string>{ ticket }, started.eligible_tickets);

	ASSERT_FALSE (context.plugin->execute ("castvotes", politeia::encode_cast_votes ({ politeia::signed_vote (key, token, ticket, "2") }), reply));
	std::vector<politeia::cast_vote_reply> replies;
	ASSERT_FALSE (politeia::decode_cast_vote_replies (reply, replies));
	ASSERT_EQ (1, replies.size ());
	ASSERT_TRUE (replies[0].error.empty ());
	ASSERT_FALSE (replies[0].signature.empty ());
	ASSERT_TRUE (boost::filesystem::exists (politeia::decred_plugin::vetted_path (context.data_path) / token / "votes"));

	context.plugin->stop ();
	ASSERT_EQ (politeia::error_plugin::shutdown_in_progress, context.plugin->execute ("castvotes", politeia::encode_cast_votes ({ politeia::signed_vote (key, token, ticket, "1") }), reply).get_code ());
}
