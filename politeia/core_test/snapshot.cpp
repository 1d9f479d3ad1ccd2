#include <politeia/core_test/testutil.hpp>
#include <politeia/lib/logger_mt.hpp>
#include <politeia/node/snapshot.hpp>

#include <gtest/gtest.h>

namespace
{
/** Answers block queries with the block after the one requested */
class off_by_one_oracle final : public politeia::blockchain_oracle
{
public:
	explicit off_by_one_oracle (politeia::blockchain_oracle & oracle_a) :
	oracle (oracle_a)
	{
	}
	politeia::error best_block (politeia::block_info & block_a) override
	{
		return oracle.best_block (block_a);
	}
	politeia::error block (uint64_t height_a, politeia::block_info & block_a) override
	{
		return oracle.block (height_a + 1, block_a);
	}
	politeia::error ticket_pool (std::string const & block_hash_a, std::vector<std::string> & tickets_a) override
	{
		return oracle.ticket_pool (block_hash_a, tickets_a);
	}
	politeia::error largest_commitment_address (std::string const & ticket_a, std::string & address_a) override
	{
		return oracle.largest_commitment_address (ticket_a, address_a);
	}

private:
	politeia::blockchain_oracle & oracle;
};
}

TEST (snapshot, maturity_depth)
{
	politeia::memory_oracle oracle (300);
	std::vector<std::string> tickets{ politeia::test_hash (1001), politeia::test_hash (1002) };
	oracle.set_pool (44, tickets);
	politeia::logger_mt logger;
	politeia::snapshotter snapshotter (oracle, logger);
	politeia::eligibility_snapshot snapshot;
	ASSERT_FALSE (snapshotter.compute (256, snapshot));
	ASSERT_EQ (44, snapshot.height);
	ASSERT_EQ (politeia::test_hash (44), snapshot.hash);
	ASSERT_EQ (tickets, snapshot.tickets);
}

TEST (snapshot, deterministic)
{
	politeia::memory_oracle oracle (100);
	oracle.set_pool (84, { politeia::test_hash (1), politeia::test_hash (2), politeia::test_hash (3) });
	politeia::logger_mt logger;
	politeia::snapshotter snapshotter (oracle, logger);
	politeia::eligibility_snapshot first;
	politeia::eligibility_snapshot second;
	ASSERT_FALSE (snapshotter.compute (16, first));
	ASSERT_FALSE (snapshotter.compute (16, second));
	ASSERT_EQ (first.height, second.height);
	ASSERT_EQ (first.hash, second.hash);
	ASSERT_EQ (first.tickets, second.tickets);
}

TEST (snapshot, chain_too_young)
{
	politeia::memory_oracle oracle (255);
	politeia::logger_mt logger;
	politeia::snapshotter snapshotter (oracle, logger);
	politeia::eligibility_snapshot snapshot;
	ASSERT_EQ (politeia::error_plugin::chain_too_young, snapshotter.compute (256, snapshot).get_code ());
	oracle.set_height (256);
	ASSERT_FALSE (snapshotter.compute (256, snapshot));
	ASSERT_EQ (0, snapshot.height);
	ASSERT_EQ (politeia::test_hash (0), snapshot.hash);
	ASSERT_TRUE (snapshot.tickets.empty ());
}

TEST (snapshot, oracle_unavailable)
{
	politeia::memory_oracle oracle (300);
	oracle.unavailable = true;
	politeia::logger_mt logger;
	politeia::snapshotter snapshotter (oracle, logger);
	politeia::eligibility_snapshot snapshot;
	snapshot.height = 7;
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, snapshotter.compute (256, snapshot).get_code ());
	ASSERT_EQ (7, snapshot.height);
}

TEST (snapshot, start_block_mismatch)
{
	politeia::memory_oracle oracle (300);
	off_by_one_oracle shifted (oracle);
	politeia::logger_mt logger;
	politeia::snapshotter snapshotter (shifted, logger);
	politeia::eligibility_snapshot snapshot;
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, snapshotter.compute (256, snapshot).get_code ());
	ASSERT_TRUE (snapshot.hash.empty ());
}
