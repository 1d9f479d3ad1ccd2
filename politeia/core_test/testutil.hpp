#pragma once

#include <politeia/node/messages.hpp>
#include <politeia/node/oracle.hpp>
#include <politeia/node/record_store.hpp>
#include <politeia/secure/message_signature.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace politeia
{
/** Hex id derived from \p seed_a, usable as a block hash, ticket or proposal token */
std::string test_hash (uint64_t seed_a);

/** Chain of \p height_a blocks whose hashes are test_hash (height) */
class memory_oracle final : public blockchain_oracle
{
public:
	explicit memory_oracle (uint64_t height_a = 0);
	politeia::error best_block (politeia::block_info & block_a) override;
	politeia::error block (uint64_t height_a, politeia::block_info & block_a) override;
	politeia::error ticket_pool (std::string const & block_hash_a, std::vector<std::string> & tickets_a) override;
	politeia::error largest_commitment_address (std::string const & ticket_a, std::string & address_a) override;
	void set_height (uint64_t height_a);
	void set_pool (uint64_t height_a, std::vector<std::string> const & tickets_a);
	void set_commitment (std::string const & ticket_a, std::string const & address_a);
	/** Every query fails with error_plugin::oracle_unavailable while set */
	std::atomic<bool> unavailable{ false };
	std::atomic<unsigned> commitment_queries{ 0 };

private:
	std::mutex mutex;
	uint64_t height;
	std::unordered_map<std::string, std::vector<std::string>> pools;
	std::unordered_map<std::string, std::string> commitments;
};

class memory_record_store final : public record_store
{
public:
	politeia::error check_vote_allowed (std::string const & token_a) override;
	politeia::error metadata (std::string const & token_a, uint32_t stream_id_a, boost::optional<std::string> & payload_a) override;
	politeia::error update_vetted_metadata (std::string const & token_a, std::vector<uint32_t> const & removals_a, std::vector<politeia::metadata_stream> const & additions_a) override;
	void add (std::string const & token_a, std::string const & status_a = "public");
	/** Updates fail with error_record::record_io while set */
	std::atomic<bool> fail_updates{ false };
	std::atomic<unsigned> updates{ 0 };

private:
	class record final
	{
	public:
		std::string status;
		std::map<uint32_t, std::string> streams;
	};
	std::mutex mutex;
	std::unordered_map<std::string, record> records;
};

/** A cast vote on \p token_a signed by \p key_a the way a wallet signs it */
politeia::cast_vote signed_vote (politeia::private_key const & key_a, std::string const & token_a, std::string const & ticket_a, std::string const & vote_bit_a);
}
