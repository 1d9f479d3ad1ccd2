#include <politeia/core_test/testutil.hpp>

#include <boost/format.hpp>

std::string politeia::test_hash (uint64_t seed_a)
{
	return boost::str (boost::format ("%064x") % seed_a);
}

politeia::memory_oracle::memory_oracle (uint64_t height_a) :
height (height_a)
{
}

politeia::error politeia::memory_oracle::best_block (politeia::block_info & block_a)
{
	uint64_t height_l;
	{
		std::lock_guard<std::mutex> lock (mutex);
		height_l = height;
	}
	return block (height_l, block_a);
}

politeia::error politeia::memory_oracle::block (uint64_t height_a, politeia::block_info & block_a)
{
	politeia::error result;
	std::lock_guard<std::mutex> lock (mutex);
	if (unavailable || height_a > height)
	{
		result.set ("Block not available", politeia::error_plugin::oracle_unavailable);
	}
	else
	{
		block_a.height = height_a;
		block_a.hash = politeia::test_hash (height_a);
	}
	return result;
}

politeia::error politeia::memory_oracle::ticket_pool (std::string const & block_hash_a, std::vector<std::string> & tickets_a)
{
	politeia::error result;
	std::lock_guard<std::mutex> lock (mutex);
	if (unavailable)
	{
		result.set ("Ticket pool not available", politeia::error_plugin::oracle_unavailable);
	}
	else
	{
		auto existing (pools.find (block_hash_a));
		tickets_a = existing != pools.end () ? existing->second : std::vector<std::string> ();
	}
	return result;
}

politeia::error politeia::memory_oracle::largest_commitment_address (std::string const & ticket_a, std::string & address_a)
{
	politeia::error result;
	++commitment_queries;
	std::lock_guard<std::mutex> lock (mutex);
	auto existing (commitments.find (ticket_a));
	if (unavailable || existing == commitments.end ())
	{
		result.set ("Ticket " + ticket_a + " not available", politeia::error_plugin::oracle_unavailable);
	}
	else
	{
		address_a = existing->second;
	}
	return result;
}

void politeia::memory_oracle::set_height (uint64_t height_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	height = height_a;
}

void politeia::memory_oracle::set_pool (uint64_t height_a, std::vector<std::string> const & tickets_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	pools[politeia::test_hash (height_a)] = tickets_a;
}

void politeia::memory_oracle::set_commitment (std::string const & ticket_a, std::string const & address_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	commitments[ticket_a] = address_a;
}

politeia::error politeia::memory_record_store::check_vote_allowed (std::string const & token_a)
{
	politeia::error result;
	std::lock_guard<std::mutex> lock (mutex);
	auto existing (records.find (token_a));
	if (existing == records.end ())
	{
		result = politeia::error_record::record_not_found;
	}
	else if (existing->second.status != "public")
	{
		result = politeia::error_record::record_not_public;
	}
	return result;
}

politeia::error politeia::memory_record_store::metadata (std::string const & token_a, uint32_t stream_id_a, boost::optional<std::string> & payload_a)
{
	politeia::error result;
	payload_a = boost::none;
	std::lock_guard<std::mutex> lock (mutex);
	auto existing (records.find (token_a));
	if (existing == records.end ())
	{
		result = politeia::error_record::record_not_found;
	}
	else
	{
		auto stream (existing->second.streams.find (stream_id_a));
		if (stream != existing->second.streams.end ())
		{
			payload_a = stream->second;
		}
	}
	return result;
}

politeia::error politeia::memory_record_store::update_vetted_metadata (std::string const & token_a, std::vector<uint32_t> const & removals_a, std::vector<politeia::metadata_stream> const & additions_a)
{
	politeia::error result;
	std::lock_guard<std::mutex> lock (mutex);
	auto existing (records.find (token_a));
	if (existing == records.end ())
	{
		result = politeia::error_record::record_not_found;
	}
	else if (fail_updates)
	{
		result = politeia::error_record::record_io;
	}
	else
	{
		for (auto id : removals_a)
		{
			existing->second.streams.erase (id);
		}
		for (auto const & stream : additions_a)
		{
			existing->second.streams[stream.id] = stream.payload;
		}
		++updates;
	}
	return result;
}

void politeia::memory_record_store::add (std::string const & token_a, std::string const & status_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	records[token_a].status = status_a;
}

politeia::cast_vote politeia::signed_vote (politeia::private_key const & key_a, std::string const & token_a, std::string const & ticket_a, std::string const & vote_bit_a)
{
	politeia::cast_vote result;
	result.token = token_a;
	result.ticket = ticket_a;
	result.vote_bit = vote_bit_a;
	auto signature (key_a.sign_compact (politeia::signed_message_hash (result.message ())));
	result.signature = politeia::to_hex (signature);
	return result;
}
