#pragma once

#include <politeia/lib/errors.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace politeia
{
class logger_mt;
class record_store;
class snapshotter;
class write_lock;

/** Starts votes: fixes the electorate of a proposal and records it with the proposal */
class vote_session_manager final
{
public:
	vote_session_manager (politeia::record_store & records_a, politeia::snapshotter & snapshotter_a, politeia::write_lock & write_lock_a, politeia::logger_mt & logger_a, uint32_t ticket_maturity_a, uint32_t vote_duration_a, std::chrono::milliseconds lock_timeout_a);
	/**
	 * Decodes a vote request, snapshots the ticket pool and attaches the request and the
	 * snapshot to the record as the vote bits and vote snapshot metadata streams
	 * @param reply_a The encoded start_vote_reply
	 */
	politeia::error start_vote (std::string const & payload_a, std::string & reply_a);

private:
	/** @return vote_already_started if the record already holds a vote snapshot */
	politeia::error check_not_started (std::string const & token_a);
	politeia::record_store & records;
	politeia::snapshotter & snapshotter;
	politeia::write_lock & write_lock;
	politeia::logger_mt & logger;
	uint32_t ticket_maturity;
	uint32_t vote_duration;
	std::chrono::milliseconds lock_timeout;
};
}
