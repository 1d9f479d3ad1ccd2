#include <politeia/lib/logger_mt.hpp>
#include <politeia/node/oracle.hpp>
#include <politeia/node/snapshot.hpp>

#include <boost/format.hpp>

politeia::snapshotter::snapshotter (politeia::blockchain_oracle & oracle_a, politeia::logger_mt & logger_a) :
oracle (oracle_a),
logger (logger_a)
{
}

politeia::error politeia::snapshotter::compute (uint32_t maturity_a, politeia::eligibility_snapshot & snapshot_a)
{
	politeia::block_info best;
	auto result (oracle.best_block (best));
	if (!result)
	{
		if (best.height < maturity_a)
		{
			result.set (boost::str (boost::format ("Best block height %1% is below ticket maturity %2%") % best.height % maturity_a), politeia::error_plugin::chain_too_young);
		}
	}
	politeia::block_info start;
	auto start_height (best.height - maturity_a);
	if (!result)
	{
		result = oracle.block (start_height, start);
	}
	if (!result && start.height != start_height)
	{
		result.set (boost::str (boost::format ("Requested block %1% but received block %2%") % start_height % start.height), politeia::error_plugin::oracle_unavailable);
	}
	politeia::eligibility_snapshot snapshot;
	if (!result)
	{
		snapshot.height = start_height;
		snapshot.hash = start.hash;
		result = oracle.ticket_pool (start.hash, snapshot.tickets);
	}
	if (!result)
	{
		logger.always_log (boost::str (boost::format ("Snapshot of block %1% at height %2% has %3% eligible tickets") % snapshot.hash % snapshot.height % snapshot.tickets.size ()));
		snapshot_a = std::move (snapshot);
	}
	return result;
}
