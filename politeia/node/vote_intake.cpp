#include <politeia/lib/encoding.hpp>
#include <politeia/lib/logger_mt.hpp>
#include <politeia/node/logging.hpp>
#include <politeia/node/oracle.hpp>
#include <politeia/node/vote_intake.hpp>
#include <politeia/node/vote_ledger.hpp>
#include <politeia/node/write_lock.hpp>
#include <politeia/secure/identity.hpp>
#include <politeia/secure/message_signature.hpp>

#include <boost/format.hpp>

#include <map>
#include <set>

std::string politeia::to_string (politeia::vote_status status_a)
{
	std::string result;
	switch (status_a)
	{
		case politeia::vote_status::accepted:
			result = "accepted";
			break;
		case politeia::vote_status::duplicate:
			result = "duplicate";
			break;
		case politeia::vote_status::invalid_token:
			result = "invalid_token";
			break;
		case politeia::vote_status::invalid_signature:
			result = "invalid_signature";
			break;
		case politeia::vote_status::already_voted:
			result = "already_voted";
			break;
		case politeia::vote_status::token_failed:
			result = "token_failed";
			break;
	}
	return result;
}

politeia::vote_intake::vote_intake (politeia::blockchain_oracle & oracle_a, politeia::network_params const & network_a, politeia::identity const & identity_a, politeia::write_lock & write_lock_a, boost::filesystem::path const & vetted_path_a, politeia::logger_mt & logger_a, politeia::logging const & logging_a, std::chrono::milliseconds lock_timeout_a) :
oracle (oracle_a),
network (network_a),
identity (identity_a),
write_lock (write_lock_a),
vetted_path (vetted_path_a),
logger (logger_a),
logging (logging_a),
lock_timeout (lock_timeout_a)
{
}

politeia::error politeia::vote_intake::verify (politeia::cast_vote const & vote_a)
{
	std::string address;
	auto result (oracle.largest_commitment_address (vote_a.ticket, address));
	politeia::byte_vector signature;
	if (!result && politeia::from_hex (vote_a.signature, signature))
	{
		result.set ("Signature is not hex", politeia::error_plugin::invalid_signature);
	}
	if (!result)
	{
		auto matched (false);
		result = politeia::verify_message (network, address, vote_a.message (), politeia::base64_encode (signature), matched);
		if (!result && !matched)
		{
			result.set ("could not verify message", politeia::error_plugin::invalid_signature);
		}
	}
	return result;
}

void politeia::vote_intake::reject (politeia::vote_result & result_a, politeia::vote_status status_a, std::string const & error_a, politeia::cast_vote const & vote_a)
{
	result_a.status = status_a;
	result_a.reply.error = error_a;
	if (logging.vote_logging ())
	{
		logger.always_log (boost::str (boost::format ("Vote token %1% ticket %2% rejected (%3%): %4%") % vote_a.token % vote_a.ticket % politeia::to_string (status_a) % error_a));
	}
}

politeia::error politeia::vote_intake::cast_votes (std::string const & payload_a, std::string & reply_a)
{
	std::vector<politeia::cast_vote> votes;
	auto result (politeia::decode_cast_votes (payload_a, votes));
	std::vector<politeia::vote_result> results;
	if (!result)
	{
		result = cast_votes (votes, results);
	}
	if (!result)
	{
		std::vector<politeia::cast_vote_reply> replies;
		replies.reserve (results.size ());
		for (auto & vote_result : results)
		{
			replies.push_back (std::move (vote_result.reply));
		}
		reply_a = politeia::encode_cast_vote_replies (replies);
	}
	return result;
}

politeia::error politeia::vote_intake::cast_votes (std::vector<politeia::cast_vote> const & votes_a, std::vector<politeia::vote_result> & results_a)
{
	politeia::error result;
	std::vector<politeia::vote_result> results (votes_a.size ());
	std::set<std::pair<std::string, std::string>> seen;
	// Surviving votes by token, in input order
	std::map<std::string, std::vector<size_t>> pending;
	for (size_t i (0), n (votes_a.size ()); i < n; ++i)
	{
		auto const & vote (votes_a[i]);
		auto & vote_result (results[i]);
		if (!seen.emplace (vote.token, vote.ticket).second)
		{
			reject (vote_result, politeia::vote_status::duplicate, boost::str (boost::format ("duplicate vote token %1% ticket %2%") % vote.token % vote.ticket), vote);
			continue;
		}
		vote_result.reply.client_signature = vote.signature;
		if (!politeia::is_hex (vote.token))
		{
			reject (vote_result, politeia::vote_status::invalid_token, "invalid proposal token: " + vote.token, vote);
			continue;
		}
		auto error (verify (vote));
		if (error)
		{
			reject (vote_result, politeia::vote_status::invalid_signature, error.get_message (), vote);
			continue;
		}
		pending[vote.token].push_back (i);
	}
	if (!pending.empty ())
	{
		boost::optional<politeia::write_guard> guard;
		result = write_lock.acquire (lock_timeout, guard);
		if (!result)
		{
			for (auto const & token : pending)
			{
				record (token.first, token.second, votes_a, results, *guard);
			}
		}
		else if (result.get_code () == politeia::error_plugin::backend_busy)
		{
			logger.try_log (boost::str (boost::format ("Cast votes timed out waiting for the write lock after %1% ms") % lock_timeout.count ()));
		}
	}
	if (!result)
	{
		results_a = std::move (results);
	}
	return result;
}

void politeia::vote_intake::record (std::string const & token_a, std::vector<size_t> const & indices_a, std::vector<politeia::cast_vote> const & votes_a, std::vector<politeia::vote_result> & results_a, politeia::write_guard const & guard_a)
{
	politeia::vote_ledger ledger (vetted_path, token_a);
	auto error (ledger.open ());
	if (!error)
	{
		error = ledger.replay ();
	}
	for (auto i (indices_a.begin ()), n (indices_a.end ()); i != n; ++i)
	{
		auto const & vote (votes_a[*i]);
		auto & vote_result (results_a[*i]);
		if (!error)
		{
			if (ledger.contains (vote.ticket))
			{
				reject (vote_result, politeia::vote_status::already_voted, "ticket already voted on proposal", vote);
				continue;
			}
			error = ledger.append (guard_a, vote);
			if (!error)
			{
				auto signature (identity.sign (vote.signature));
				vote_result.status = politeia::vote_status::accepted;
				vote_result.reply.signature = politeia::to_hex (signature.data (), signature.size ());
				if (logging.vote_logging ())
				{
					logger.always_log (boost::str (boost::format ("Vote token %1% ticket %2% accepted") % vote.token % vote.ticket));
				}
				continue;
			}
		}
		if (error)
		{
			if (i == indices_a.begin () || results_a[*(i - 1)].status != politeia::vote_status::token_failed)
			{
				logger.always_log (boost::str (boost::format ("ALERT: votes for token %1% not recorded: %2%") % token_a % error.get_message ()));
			}
			reject (vote_result, politeia::vote_status::token_failed, error.get_message (), vote);
		}
	}
}
