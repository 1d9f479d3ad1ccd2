#include <politeia/core_test/testutil.hpp>
#include <politeia/lib/logger_mt.hpp>
#include <politeia/node/messages.hpp>
#include <politeia/node/snapshot.hpp>
#include <politeia/node/vote_session.hpp>
#include <politeia/node/write_lock.hpp>

#include <boost/format.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

namespace
{
std::string vote_payload (std::string const & token_a, std::string const & mask_a = "3")
{
	return boost::str (boost::format (R"({"token":"%1%","mask":%2%,"options":[{"id":"no","description":"Don't approve proposal","bits":1},{"id":"yes","description":"Approve proposal","bits":"2"}]})") % token_a % mask_a);
}

/** Delays best_block so a caller can observe what is held during the snapshot */
class slow_oracle final : public politeia::blockchain_oracle
{
public:
	slow_oracle (politeia::blockchain_oracle & oracle_a, std::chrono::milliseconds delay_a) :
	oracle (oracle_a),
	delay (delay_a)
	{
	}
	politeia::error best_block (politeia::block_info & block_a) override
	{
		querying = true;
		std::this_thread::sleep_for (delay);
		return oracle.best_block (block_a);
	}
	politeia::error block (uint64_t height_a, politeia::block_info & block_a) override
	{
		return oracle.block (height_a, block_a);
	}
	politeia::error ticket_pool (std::string const & block_hash_a, std::vector<std::string> & tickets_a) override
	{
		return oracle.ticket_pool (block_hash_a, tickets_a);
	}
	politeia::error largest_commitment_address (std::string const & ticket_a, std::string & address_a) override
	{
		return oracle.largest_commitment_address (ticket_a, address_a);
	}
	std::atomic<bool> querying{ false };

private:
	politeia::blockchain_oracle & oracle;
	std::chrono::milliseconds delay;
};

class session_context
{
public:
	session_context () :
	oracle (1000),
	snapshotter (oracle, logger),
	sessions (records, snapshotter, write_lock, logger, 256, 2016, std::chrono::milliseconds (100))
	{
		oracle.set_pool (744, { politeia::test_hash (7001), politeia::test_hash (7002), politeia::test_hash (7003) });
	}
	politeia::memory_oracle oracle;
	politeia::memory_record_store records;
	politeia::logger_mt logger;
	politeia::write_lock write_lock;
	politeia::snapshotter snapshotter;
	politeia::vote_session_manager sessions;
};
}

TEST (vote_session, start)
{
	session_context context;
	auto token (politeia::test_hash (1));
	context.records.add (token);
	std::string reply;
	ASSERT_FALSE (context.sessions.start_vote (vote_payload (token), reply));
	politeia::start_vote_reply decoded;
	ASSERT_FALSE (politeia::decode_start_vote_reply (reply, decoded));
	ASSERT_EQ (744, decoded.start_block_height);
	ASSERT_EQ (politeia::test_hash (744), decoded.start_block_hash);
	ASSERT_EQ (744 + 2016, decoded.end_height);
	ASSERT_EQ (3, decoded.eligible_tickets.size ());
	ASSERT_EQ (politeia::test_hash (7001), decoded.eligible_tickets[0]);
	ASSERT_NE (std::string::npos, reply.find (R"("startblockheight":"744")"));
}

TEST (vote_session, metadata_streams)
{
	session_context context;
	auto token (politeia::test_hash (2));
	context.records.add (token);
	std::string reply;
	auto payload (vote_payload (token));
	ASSERT_FALSE (context.sessions.start_vote (payload, reply));
	boost::optional<std::string> vote_bits;
	ASSERT_FALSE (context.records.metadata (token, politeia::decred_plugin_constants::md_stream_vote_bits, vote_bits));
	ASSERT_TRUE (vote_bits);
	ASSERT_EQ (payload, *vote_bits);
	boost::optional<std::string> snapshot;
	ASSERT_FALSE (context.records.metadata (token, politeia::decred_plugin_constants::md_stream_vote_snapshot, snapshot));
	ASSERT_TRUE (snapshot);
	ASSERT_EQ (reply, *snapshot);
	ASSERT_EQ (1, context.records.updates.load ());
}

TEST (vote_session, already_started)
{
	session_context context;
	auto token (politeia::test_hash (3));
	context.records.add (token);
	std::string reply;
	ASSERT_FALSE (context.sessions.start_vote (vote_payload (token), reply));
	context.oracle.set_height (1100);
	std::string second;
	ASSERT_EQ (politeia::error_plugin::vote_already_started, context.sessions.start_vote (vote_payload (token), second).get_code ());
	ASSERT_TRUE (second.empty ());
	boost::optional<std::string> snapshot;
	ASSERT_FALSE (context.records.metadata (token, politeia::decred_plugin_constants::md_stream_vote_snapshot, snapshot));
	ASSERT_EQ (reply, *snapshot);
}

TEST (vote_session, malformed_token)
{
	session_context context;
	std::string reply;
	ASSERT_EQ (politeia::error_plugin::malformed_token, context.sessions.start_vote (vote_payload ("abcd"), reply).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_token, context.sessions.start_vote (vote_payload (std::string (64, 'z')), reply).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, context.sessions.start_vote ("{\"token\":", reply).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, context.sessions.start_vote ("[]", reply).get_code ());
}

TEST (vote_session, invalid_bits)
{
	session_context context;
	auto token (politeia::test_hash (4));
	context.records.add (token);
	std::string reply;
	// Option "yes" uses bit 2 which is outside the mask
	ASSERT_EQ (politeia::error_plugin::invalid_vote_bits, context.sessions.start_vote (vote_payload (token, "1"), reply).get_code ());
	ASSERT_EQ (politeia::error_plugin::invalid_vote_bits, context.sessions.start_vote (vote_payload (token, "0"), reply).get_code ());
	ASSERT_EQ (0, context.records.updates.load ());
}

TEST (vote_session, record_rejected)
{
	session_context context;
	auto unvetted (politeia::test_hash (5));
	context.records.add (unvetted, "unreviewed");
	std::string reply;
	ASSERT_EQ (politeia::error_record::record_not_public, context.sessions.start_vote (vote_payload (unvetted), reply).get_code ());
	ASSERT_EQ (politeia::error_record::record_not_found, context.sessions.start_vote (vote_payload (politeia::test_hash (6)), reply).get_code ());
	ASSERT_EQ (0, context.records.updates.load ());
}

TEST (vote_session, store_failure)
{
	session_context context;
	auto token (politeia::test_hash (7));
	context.records.add (token);
	context.records.fail_updates = true;
	std::string reply;
	ASSERT_EQ (politeia::error_record::record_io, context.sessions.start_vote (vote_payload (token), reply).get_code ());
	ASSERT_TRUE (reply.empty ());
	context.records.fail_updates = false;
	ASSERT_FALSE (context.sessions.start_vote (vote_payload (token), reply));
}

TEST (vote_session, chain_too_young)
{
	session_context context;
	context.oracle.set_height (100);
	auto token (politeia::test_hash (8));
	context.records.add (token);
	std::string reply;
	ASSERT_EQ (politeia::error_plugin::chain_too_young, context.sessions.start_vote (vote_payload (token), reply).get_code ());
}

TEST (vote_session, busy)
{
	session_context context;
	auto token (politeia::test_hash (9));
	context.records.add (token);
	boost::optional<politeia::write_guard> guard;
	ASSERT_FALSE (context.write_lock.acquire (std::chrono::milliseconds (100), guard));
	std::string reply;
	ASSERT_EQ (politeia::error_plugin::backend_busy, context.sessions.start_vote (vote_payload (token), reply).get_code ());
	guard = boost::none;
	ASSERT_FALSE (context.sessions.start_vote (vote_payload (token), reply));
}

TEST (vote_session, snapshot_outside_write_lock)
{
	session_context context;
	auto token (politeia::test_hash (10));
	context.records.add (token);
	slow_oracle oracle (context.oracle, std::chrono::milliseconds (500));
	politeia::snapshotter snapshotter (oracle, context.logger);
	politeia::vote_session_manager sessions (context.records, snapshotter, context.write_lock, context.logger, 256, 2016, std::chrono::milliseconds (5000));
	std::string reply;
	politeia::error start_error;
	std::thread start ([&sessions, &token, &reply, &start_error]() {
		start_error = sessions.start_vote (vote_payload (token), reply);
	});
	while (!oracle.querying)
	{
		std::this_thread::yield ();
	}
	{
		boost::optional<politeia::write_guard> guard;
		EXPECT_FALSE (context.write_lock.acquire (std::chrono::milliseconds (100), guard));
	}
	start.join ();
	ASSERT_FALSE (start_error);
	ASSERT_FALSE (reply.empty ());
	ASSERT_EQ (1, context.records.updates.load ());
}

TEST (vote_session, concurrent_start)
{
	session_context context;
	auto token (politeia::test_hash (11));
	context.records.add (token);
	std::string first;
	std::string second;
	politeia::error first_error;
	politeia::error second_error;
	std::thread one ([&context, &token, &first, &first_error]() {
		first_error = context.sessions.start_vote (vote_payload (token), first);
	});
	std::thread two ([&context, &token, &second, &second_error]() {
		second_error = context.sessions.start_vote (vote_payload (token), second);
	});
	one.join ();
	two.join ();
	ASSERT_NE (!first_error, !second_error);
	ASSERT_EQ (1, context.records.updates.load ());
}
