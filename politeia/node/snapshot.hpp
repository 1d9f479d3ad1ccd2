#pragma once

#include <politeia/lib/errors.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace politeia
{
class blockchain_oracle;
class logger_mt;

/** The electorate of a vote: the live ticket pool at a block deep enough not to be reorganized */
class eligibility_snapshot final
{
public:
	uint64_t height{ 0 };
	std::string hash;
	std::vector<std::string> tickets;
};

class snapshotter final
{
public:
	snapshotter (politeia::blockchain_oracle & oracle_a, politeia::logger_mt & logger_a);
	/**
	 * Takes the ticket pool at best height - \p maturity_a
	 * @return error_plugin::chain_too_young if the chain is shorter than \p maturity_a,
	 * error_plugin::oracle_unavailable if a query fails
	 */
	politeia::error compute (uint32_t maturity_a, politeia::eligibility_snapshot & snapshot_a);

private:
	politeia::blockchain_oracle & oracle;
	politeia::logger_mt & logger;
};
}
