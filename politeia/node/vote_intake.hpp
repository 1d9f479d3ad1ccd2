#pragma once

#include <politeia/lib/errors.hpp>
#include <politeia/node/messages.hpp>
#include <politeia/secure/network.hpp>

#include <boost/filesystem/path.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace politeia
{
class blockchain_oracle;
class identity;
class logger_mt;
class logging;
class write_guard;
class write_lock;

enum class vote_status
{
	accepted,
	/** The same token and ticket appear earlier in the batch */
	duplicate,
	invalid_token,
	invalid_signature,
	already_voted,
	/** The proposal's ledger could not be read or written */
	token_failed
};

std::string to_string (politeia::vote_status status_a);

class vote_result final
{
public:
	politeia::vote_status status{ politeia::vote_status::accepted };
	politeia::cast_vote_reply reply;
};

/** Validates batches of votes and records the accepted ones in the proposals' ledgers */
class vote_intake final
{
public:
	vote_intake (politeia::blockchain_oracle & oracle_a, politeia::network_params const & network_a, politeia::identity const & identity_a, politeia::write_lock & write_lock_a, boost::filesystem::path const & vetted_path_a, politeia::logger_mt & logger_a, politeia::logging const & logging_a, std::chrono::milliseconds lock_timeout_a);
	/**
	 * Decodes a JSON array of cast votes and replies with a JSON array of cast vote replies in the same order
	 * @return error_plugin::malformed_request, error_plugin::backend_busy or error_plugin::shutdown_in_progress,
	 * every other problem is reported in the vote's reply
	 */
	politeia::error cast_votes (std::string const & payload_a, std::string & reply_a);
	politeia::error cast_votes (std::vector<politeia::cast_vote> const & votes_a, std::vector<politeia::vote_result> & results_a);
	/**
	 * Checks the vote is signed by the largest commitment address of its ticket
	 * @return error_plugin::invalid_signature, error_plugin::invalid_address, error_plugin::malformed_request or
	 * error_plugin::oracle_unavailable
	 */
	politeia::error verify (politeia::cast_vote const & vote_a);

private:
	void record (std::string const & token_a, std::vector<size_t> const & indices_a, std::vector<politeia::cast_vote> const & votes_a, std::vector<politeia::vote_result> & results_a, politeia::write_guard const & guard_a);
	void reject (politeia::vote_result & result_a, politeia::vote_status status_a, std::string const & error_a, politeia::cast_vote const & vote_a);

	politeia::blockchain_oracle & oracle;
	politeia::network_params network;
	politeia::identity const & identity;
	politeia::write_lock & write_lock;
	boost::filesystem::path vetted_path;
	politeia::logger_mt & logger;
	politeia::logging const & logging;
	std::chrono::milliseconds lock_timeout;
};
}
