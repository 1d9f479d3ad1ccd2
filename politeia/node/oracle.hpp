#pragma once

#include <politeia/lib/errors.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace politeia
{
class logger_mt;

class block_info final
{
public:
	uint64_t height{ 0 };
	std::string hash;
};

/**
 * Read-only view of the Decred chain. Implementations are called concurrently and must not
 * share mutable state between calls.
 */
class blockchain_oracle
{
public:
	virtual ~blockchain_oracle () = default;
	virtual politeia::error best_block (politeia::block_info & block_a) = 0;
	virtual politeia::error block (uint64_t height_a, politeia::block_info & block_a) = 0;
	/** Live tickets at the block with hash \p block_hash_a, sorted */
	virtual politeia::error ticket_pool (std::string const & block_hash_a, std::vector<std::string> & tickets_a) = 0;
	/** Address of the largest commitment output of the ticket purchase \p ticket_a */
	virtual politeia::error largest_commitment_address (std::string const & ticket_a, std::string & address_a) = 0;
};

namespace dcrdata
{
	/** Decoders of dcrdata API bodies, all failures are error_plugin::oracle_unavailable */
	politeia::error parse_block (std::string const & body_a, politeia::block_info & block_a);
	politeia::error parse_ticket_pool (std::string const & body_a, std::vector<std::string> & tickets_a);
	politeia::error parse_largest_commitment_address (std::string const & body_a, std::string & address_a);
	/** Hashes and ticket ids become part of a request target so only alphanumerics are accepted */
	bool valid_argument (std::string const & argument_a);
}

/** Base URL of an HTTP service split into its parts */
class service_url final
{
public:
	/** @return true if \p url_a is not http(s)://host[:port][/path] */
	bool parse (std::string const & url_a);
	std::string to_string () const;
	bool secure{ false };
	std::string host;
	std::string port;
	/** Always ends with '/' */
	std::string path;
};

/** blockchain_oracle querying a dcrdata block explorer over HTTP or HTTPS */
class dcrdata_oracle final : public blockchain_oracle
{
public:
	dcrdata_oracle (politeia::service_url const & url_a, std::chrono::milliseconds timeout_a, politeia::logger_mt & logger_a, bool log_requests_a);
	politeia::error best_block (politeia::block_info & block_a) override;
	politeia::error block (uint64_t height_a, politeia::block_info & block_a) override;
	politeia::error ticket_pool (std::string const & block_hash_a, std::vector<std::string> & tickets_a) override;
	politeia::error largest_commitment_address (std::string const & ticket_a, std::string & address_a) override;

private:
	/** GET \p resource_a relative to the base URL, any failure or non-200 status is error_plugin::oracle_unavailable */
	politeia::error get (std::string const & resource_a, std::string & body_a);

	politeia::service_url url;
	std::chrono::milliseconds timeout;
	politeia::logger_mt & logger;
	bool log_requests;
};
}
