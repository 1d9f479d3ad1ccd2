#include <politeia/lib/encoding.hpp>
#include <politeia/lib/logger_mt.hpp>
#include <politeia/node/messages.hpp>
#include <politeia/node/record_store.hpp>
#include <politeia/node/snapshot.hpp>
#include <politeia/node/vote_session.hpp>
#include <politeia/node/write_lock.hpp>

#include <boost/format.hpp>

namespace
{
size_t constexpr token_size = 32;
}

politeia::vote_session_manager::vote_session_manager (politeia::record_store & records_a, politeia::snapshotter & snapshotter_a, politeia::write_lock & write_lock_a, politeia::logger_mt & logger_a, uint32_t ticket_maturity_a, uint32_t vote_duration_a, std::chrono::milliseconds lock_timeout_a) :
records (records_a),
snapshotter (snapshotter_a),
write_lock (write_lock_a),
logger (logger_a),
ticket_maturity (ticket_maturity_a),
vote_duration (vote_duration_a),
lock_timeout (lock_timeout_a)
{
}

politeia::error politeia::vote_session_manager::check_not_started (std::string const & token_a)
{
	auto result (records.check_vote_allowed (token_a));
	if (!result)
	{
		boost::optional<std::string> existing;
		result = records.metadata (token_a, politeia::decred_plugin_constants::md_stream_vote_snapshot, existing);
		if (!result && existing)
		{
			result.set ("Vote already started for " + token_a, politeia::error_plugin::vote_already_started);
		}
	}
	return result;
}

politeia::error politeia::vote_session_manager::start_vote (std::string const & payload_a, std::string & reply_a)
{
	politeia::vote_request request;
	auto result (politeia::decode_vote_request (payload_a, request));
	if (!result)
	{
		result = request.validate_bits ();
	}
	if (!result && (request.token.size () != 2 * token_size || !politeia::is_hex (request.token)))
	{
		result.set ("Invalid proposal token: " + request.token, politeia::error_plugin::malformed_token);
	}
	if (!result)
	{
		result = check_not_started (request.token);
	}
	// The snapshot queries the block explorer and runs without the write lock
	politeia::eligibility_snapshot snapshot;
	if (!result)
	{
		result = snapshotter.compute (ticket_maturity, snapshot);
	}
	boost::optional<politeia::write_guard> guard;
	if (!result)
	{
		result = write_lock.acquire (lock_timeout, guard);
		if (result.get_code () == politeia::error_plugin::backend_busy)
		{
			logger.try_log ("Start vote for ", request.token, " timed out waiting for the write lock");
		}
	}
	if (!result)
	{
		result = check_not_started (request.token);
	}
	if (!result)
	{
		politeia::start_vote_reply reply;
		reply.start_block_height = snapshot.height;
		reply.start_block_hash = snapshot.hash;
		reply.end_height = snapshot.height + vote_duration;
		reply.eligible_tickets = std::move (snapshot.tickets);
		auto encoded (politeia::encode_start_vote_reply (reply));
		std::vector<politeia::metadata_stream> streams;
		streams.push_back ({ politeia::decred_plugin_constants::md_stream_vote_bits, payload_a });
		streams.push_back ({ politeia::decred_plugin_constants::md_stream_vote_snapshot, encoded });
		result = records.update_vetted_metadata (request.token, {}, streams);
		if (!result)
		{
			logger.always_log (boost::str (boost::format ("Vote started for: %1% snapshot %2% start %3% end %4% eligible %5%") % request.token % reply.start_block_hash % reply.start_block_height % reply.end_height % reply.eligible_tickets.size ()));
			reply_a = encoded;
		}
	}
	return result;
}
