#include <politeia/core_test/testutil.hpp>
#include <politeia/lib/logger_mt.hpp>
#include <politeia/node/logging.hpp>
#include <politeia/node/vote_intake.hpp>
#include <politeia/node/vote_ledger.hpp>
#include <politeia/node/write_lock.hpp>
#include <politeia/secure/identity.hpp>
#include <politeia/secure/utility.hpp>

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <thread>

namespace
{
class intake_context
{
public:
	intake_context () :
	network (politeia::dcr_networks::mainnet),
	identity (politeia::identity::generate ()),
	vetted_path (politeia::unique_path () / "vetted"),
	key (politeia::private_key::generate ()),
	intake (oracle, network, identity, write_lock, vetted_path, logger, logging, std::chrono::milliseconds (100))
	{
		logging.vote_logging_value = true;
	}
	/** Creates the record directory the record store keeps for a published proposal */
	void add_record (std::string const & token_a)
	{
		boost::filesystem::create_directories (vetted_path / token_a);
	}
	/** Registers \p ticket_a as a ticket whose largest commitment pays to key */
	void add_ticket (std::string const & ticket_a)
	{
		oracle.set_commitment (ticket_a, key.address (network).to_string ());
	}
	politeia::cast_vote vote (std::string const & token_a, std::string const & ticket_a, std::string const & vote_bit_a = "1")
	{
		return politeia::signed_vote (key, token_a, ticket_a, vote_bit_a);
	}
	size_t ledger_size (std::string const & token_a)
	{
		politeia::vote_ledger ledger (vetted_path, token_a);
		auto error (ledger.open ());
		if (!error)
		{
			error = ledger.replay ();
		}
		EXPECT_FALSE (error);
		return ledger.size ();
	}
	politeia::memory_oracle oracle;
	politeia::network_params network;
	politeia::identity identity;
	politeia::write_lock write_lock;
	boost::filesystem::path vetted_path;
	politeia::logger_mt logger;
	politeia::logging logging;
	politeia::private_key key;
	politeia::vote_intake intake;
};

bool counter_signed (politeia::identity const & identity_a, politeia::cast_vote_reply const & reply_a)
{
	politeia::byte_vector bytes;
	auto valid (!politeia::from_hex (reply_a.signature, bytes) && bytes.size () == 64);
	if (valid)
	{
		politeia::ed25519_signature signature;
		std::copy (bytes.begin (), bytes.end (), signature.begin ());
		valid = politeia::ed25519_verify (identity_a.public_key, reply_a.client_signature, signature);
	}
	return valid;
}
}

TEST (vote_intake, duplicate_and_tampered)
{
	intake_context context;
	context.add_record ("abc123");
	context.add_ticket ("T1");
	context.add_ticket ("T2");
	auto tampered (context.vote ("abc123", "T2"));
	tampered.vote_bit = "2";
	std::vector<politeia::cast_vote> votes{ context.vote ("abc123", "T1"), context.vote ("abc123", "T1"), tampered };
	std::vector<politeia::vote_result> results;
	ASSERT_FALSE (context.intake.cast_votes (votes, results));
	ASSERT_EQ (3, results.size ());

	ASSERT_EQ (politeia::vote_status::accepted, results[0].status);
	ASSERT_EQ (votes[0].signature, results[0].reply.client_signature);
	ASSERT_TRUE (results[0].reply.error.empty ());
	ASSERT_TRUE (counter_signed (context.identity, results[0].reply));

	ASSERT_EQ (politeia::vote_status::duplicate, results[1].status);
	ASSERT_EQ ("duplicate vote token abc123 ticket T1", results[1].reply.error);
	ASSERT_TRUE (results[1].reply.client_signature.empty ());
	ASSERT_TRUE (results[1].reply.signature.empty ());

	ASSERT_EQ (politeia::vote_status::invalid_signature, results[2].status);
	ASSERT_EQ ("could not verify message", results[2].reply.error);
	ASSERT_EQ (tampered.signature, results[2].reply.client_signature);
	ASSERT_TRUE (results[2].reply.signature.empty ());

	// The duplicate was rejected before its commitment was looked up
	ASSERT_EQ (2, context.oracle.commitment_queries.load ());
	ASSERT_EQ (1, context.ledger_size ("abc123"));
}

TEST (vote_intake, idempotent)
{
	intake_context context;
	auto token (politeia::test_hash (1));
	context.add_record (token);
	std::vector<politeia::cast_vote> votes;
	for (uint64_t i (0); i < 5; ++i)
	{
		auto ticket (politeia::test_hash (100 + i));
		context.add_ticket (ticket);
		votes.push_back (context.vote (token, ticket));
	}
	std::vector<politeia::vote_result> results;
	ASSERT_FALSE (context.intake.cast_votes (votes, results));
	for (auto const & result : results)
	{
		ASSERT_EQ (politeia::vote_status::accepted, result.status);
	}
	ASSERT_EQ (5, context.ledger_size (token));
	auto ledger (politeia::vote_ledger::ledger_path (context.vetted_path, token));
	auto length (boost::filesystem::file_size (ledger));
	std::vector<politeia::vote_result> replayed;
	ASSERT_FALSE (context.intake.cast_votes (votes, replayed));
	ASSERT_EQ (5, replayed.size ());
	for (auto const & result : replayed)
	{
		ASSERT_EQ (politeia::vote_status::already_voted, result.status);
		ASSERT_EQ ("ticket already voted on proposal", result.reply.error);
		ASSERT_TRUE (result.reply.signature.empty ());
	}
	ASSERT_EQ (5, context.ledger_size (token));
	ASSERT_EQ (length, boost::filesystem::file_size (ledger));
}

TEST (vote_intake, different_vote_bit_same_ticket)
{
	intake_context context;
	auto token (politeia::test_hash (2));
	context.add_record (token);
	context.add_ticket ("T1");
	std::vector<politeia::vote_result> results;
	ASSERT_FALSE (context.intake.cast_votes ({ context.vote (token, "T1", "1") }, results));
	ASSERT_EQ (politeia::vote_status::accepted, results[0].status);
	ASSERT_FALSE (context.intake.cast_votes ({ context.vote (token, "T1", "2") }, results));
	ASSERT_EQ (politeia::vote_status::already_voted, results[0].status);
	ASSERT_EQ (1, context.ledger_size (token));
}

TEST (vote_intake, same_ticket_other_token)
{
	intake_context context;
	context.add_record (politeia::test_hash (3));
	context.add_record (politeia::test_hash (4));
	context.add_ticket ("T1");
	std::vector<politeia::vote_result> results;
	ASSERT_FALSE (context.intake.cast_votes ({ context.vote (politeia::test_hash (3), "T1"), context.vote (politeia::test_hash (4), "T1") }, results));
	ASSERT_EQ (politeia::vote_status::accepted, results[0].status);
	ASSERT_EQ (politeia::vote_status::accepted, results[1].status);
}

TEST (vote_intake, invalid_token)
{
	intake_context context;
	context.add_ticket ("T1");
	std::vector<politeia::vote_result> results;
	ASSERT_FALSE (context.intake.cast_votes ({ context.vote ("../escape", "T1"), context.vote ("", "T1") }, results));
	ASSERT_EQ (politeia::vote_status::invalid_token, results[0].status);
	ASSERT_EQ (politeia::vote_status::invalid_token, results[1].status);
	ASSERT_FALSE (results[0].reply.client_signature.empty ());
	ASSERT_EQ (0, context.oracle.commitment_queries.load ());
	ASSERT_FALSE (boost::filesystem::exists (context.vetted_path));
}

TEST (vote_intake, unknown_ticket)
{
	intake_context context;
	auto token (politeia::test_hash (5));
	std::vector<politeia::vote_result> results;
	ASSERT_FALSE (context.intake.cast_votes ({ context.vote (token, "T9") }, results));
	ASSERT_EQ (politeia::vote_status::invalid_signature, results[0].status);
	ASSERT_NE (std::string::npos, results[0].reply.error.find ("T9"));
	ASSERT_FALSE (boost::filesystem::exists (politeia::vote_ledger::ledger_path (context.vetted_path, token)));
}

TEST (vote_intake, malformed_signature)
{
	intake_context context;
	auto token (politeia::test_hash (6));
	context.add_ticket ("T1");
	context.add_ticket ("T2");
	auto not_hex (context.vote (token, "T1"));
	not_hex.signature = "zz";
	auto short_signature (context.vote (token, "T2"));
	short_signature.signature = "1f00";
	std::vector<politeia::vote_result> results;
	ASSERT_FALSE (context.intake.cast_votes ({ not_hex, short_signature }, results));
	ASSERT_EQ (politeia::vote_status::invalid_signature, results[0].status);
	ASSERT_EQ (politeia::vote_status::invalid_signature, results[1].status);
}

TEST (vote_intake, signer_mismatch)
{
	intake_context context;
	auto token (politeia::test_hash (7));
	auto other (politeia::private_key::generate ());
	context.oracle.set_commitment ("T1", other.address (context.network).to_string ());
	std::vector<politeia::vote_result> results;
	ASSERT_FALSE (context.intake.cast_votes ({ context.vote (token, "T1") }, results));
	ASSERT_EQ (politeia::vote_status::invalid_signature, results[0].status);
	ASSERT_EQ ("could not verify message", results[0].reply.error);
}

TEST (vote_intake, corrupt_ledger_isolated)
{
	intake_context context;
	auto corrupt (politeia::test_hash (8));
	auto healthy (politeia::test_hash (9));
	auto ledger (politeia::vote_ledger::ledger_path (context.vetted_path, corrupt));
	boost::filesystem::create_directories (ledger.parent_path ());
	{
		std::ofstream stream (ledger.string ());
		stream << "not json\n";
	}
	context.add_record (healthy);
	context.add_ticket ("T1");
	context.add_ticket ("T2");
	std::vector<politeia::vote_result> results;
	ASSERT_FALSE (context.intake.cast_votes ({ context.vote (corrupt, "T1"), context.vote (healthy, "T1"), context.vote (corrupt, "T2") }, results));
	ASSERT_EQ (politeia::vote_status::token_failed, results[0].status);
	ASSERT_NE (std::string::npos, results[0].reply.error.find ("does not decode"));
	ASSERT_EQ (politeia::vote_status::accepted, results[1].status);
	ASSERT_EQ (politeia::vote_status::token_failed, results[2].status);
	ASSERT_TRUE (results[2].reply.signature.empty ());
	ASSERT_EQ (1, context.ledger_size (healthy));
}

TEST (vote_intake, busy)
{
	intake_context context;
	context.add_record (politeia::test_hash (10));
	context.add_ticket ("T1");
	boost::optional<politeia::write_guard> guard;
	ASSERT_FALSE (context.write_lock.acquire (std::chrono::milliseconds (100), guard));
	std::vector<politeia::vote_result> results;
	ASSERT_EQ (politeia::error_plugin::backend_busy, context.intake.cast_votes ({ context.vote (politeia::test_hash (10), "T1") }, results).get_code ());
	ASSERT_TRUE (results.empty ());
	// Nothing to record, the lock is not needed
	ASSERT_FALSE (context.intake.cast_votes ({ context.vote ("nothex", "T1") }, results));
	ASSERT_EQ (politeia::vote_status::invalid_token, results[0].status);
	guard = boost::none;
	ASSERT_FALSE (context.intake.cast_votes ({ context.vote (politeia::test_hash (10), "T1") }, results));
	ASSERT_EQ (politeia::vote_status::accepted, results[0].status);
}

TEST (vote_intake, shutdown)
{
	intake_context context;
	context.add_ticket ("T1");
	context.write_lock.stop ();
	std::vector<politeia::vote_result> results;
	ASSERT_EQ (politeia::error_plugin::shutdown_in_progress, context.intake.cast_votes ({ context.vote (politeia::test_hash (11), "T1") }, results).get_code ());
	ASSERT_FALSE (boost::filesystem::exists (context.vetted_path));
}

TEST (vote_intake, payload)
{
	intake_context context;
	auto token (politeia::test_hash (12));
	context.add_record (token);
	context.add_ticket ("T1");
	std::string reply;
	ASSERT_FALSE (context.intake.cast_votes (politeia::encode_cast_votes ({ context.vote (token, "T1"), context.vote (token, "T1") }), reply));
	std::vector<politeia::cast_vote_reply> replies;
	ASSERT_FALSE (politeia::decode_cast_vote_replies (reply, replies));
	ASSERT_EQ (2, replies.size ());
	ASSERT_TRUE (counter_signed (context.identity, replies[0]));
	ASSERT_FALSE (replies[1].error.empty ());
	std::string empty_reply;
	ASSERT_FALSE (context.intake.cast_votes ("[]", empty_reply));
	ASSERT_EQ ("[]", empty_reply);
	ASSERT_EQ (politeia::error_plugin::malformed_request, context.intake.cast_votes ("{\"token\":\"00\"}", reply).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, context.intake.cast_votes ("{}", reply).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, context.intake.cast_votes ("\"\"", reply).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, context.intake.cast_votes ("[{\"token\":", reply).get_code ());
}

TEST (vote_intake, concurrent_tokens)
{
	intake_context context;
	std::vector<std::thread> threads;
	std::atomic<unsigned> accepted{ 0 };
	for (uint64_t t (0); t < 4; ++t)
	{
		context.add_record (politeia::test_hash (20 + t));
		std::vector<politeia::cast_vote> votes;
		for (uint64_t i (0); i < 10; ++i)
		{
			auto ticket (politeia::test_hash (1000 * (t + 1) + i));
			context.add_ticket (ticket);
			votes.push_back (context.vote (politeia::test_hash (20 + t), ticket));
		}
		threads.emplace_back ([&context, &accepted, votes]() {
			std::vector<politeia::vote_result> results;
			politeia::vote_intake intake (context.oracle, context.network, context.identity, context.write_lock, context.vetted_path, context.logger, context.logging, std::chrono::seconds (30));
			auto error (intake.cast_votes (votes, results));
			EXPECT_FALSE (error);
			for (auto const & result : results)
			{
				if (result.status == politeia::vote_status::accepted)
				{
					++accepted;
				}
			}
		});
	}
	for (auto & thread : threads)
	{
		thread.join ();
	}
	ASSERT_EQ (40, accepted.load ());
	for (uint64_t t (0); t < 4; ++t)
	{
		ASSERT_EQ (10, context.ledger_size (politeia::test_hash (20 + t)));
	}
}

TEST (vote_intake, concurrent_same_token)
{
	intake_context context;
	auto token (politeia::test_hash (30));
	context.add_record (token);
	std::vector<politeia::cast_vote> votes;
	for (uint64_t i (0); i < 20; ++i)
	{
		auto ticket (politeia::test_hash (3000 + i));
		context.add_ticket (ticket);
		votes.push_back (context.vote (token, ticket));
	}
	std::vector<std::thread> threads;
	std::atomic<unsigned> accepted{ 0 };
	std::atomic<unsigned> already_voted{ 0 };
	for (auto i (0); i < 4; ++i)
	{
		threads.emplace_back ([&context, &accepted, &already_voted, &votes]() {
			std::vector<politeia::vote_result> results;
			politeia::vote_intake intake (context.oracle, context.network, context.identity, context.write_lock, context.vetted_path, context.logger, context.logging, std::chrono::seconds (30));
			auto error (intake.cast_votes (votes, results));
			EXPECT_FALSE (error);
			for (auto const & result : results)
			{
				if (result.status == politeia::vote_status::accepted)
				{
					++accepted;
				}
				else if (result.status == politeia::vote_status::already_voted)
				{
					++already_voted;
				}
			}
		});
	}
	for (auto & thread : threads)
	{
		thread.join ();
	}
	ASSERT_EQ (20, accepted.load ());
	ASSERT_EQ (60, already_voted.load ());
	ASSERT_EQ (20, context.ledger_size (token));
}

TEST (vote_intake, unknown_record)
{
	intake_context context;
	auto published (politeia::test_hash (40));
	auto unknown (politeia::test_hash (41));
	context.add_record (published);
	context.add_ticket ("T1");
	context.add_ticket ("T2");
	std::vector<politeia::vote_result> results;
	ASSERT_FALSE (context.intake.cast_votes ({ context.vote (unknown, "T1"), context.vote (published, "T2"), context.vote (unknown, "T2") }, results));
	ASSERT_EQ (politeia::vote_status::token_failed, results[0].status);
	ASSERT_NE (std::string::npos, results[0].reply.error.find ("Record not found"));
	ASSERT_TRUE (results[0].reply.signature.empty ());
	ASSERT_EQ (politeia::vote_status::accepted, results[1].status);
	ASSERT_EQ (politeia::vote_status::token_failed, results[2].status);
	ASSERT_FALSE (boost::filesystem::exists (context.vetted_path / unknown));
}
