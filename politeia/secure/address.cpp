#include <politeia/crypto_lib/blake256.hpp>
#include <politeia/lib/utility.hpp>
#include <politeia/secure/address.hpp>

#include <boost/format.hpp>

#include <openssl/evp.h>

#include <algorithm>

namespace
{
size_t constexpr checksum_size = 4;
size_t constexpr address_size = 2 + 20 + checksum_size;

std::array<uint8_t, checksum_size> checksum (uint8_t const * data_a, size_t size_a)
{
	auto first (politeia::blake256::hash (data_a, size_a));
	auto second (politeia::blake256::hash (first.data (), first.size ()));
	std::array<uint8_t, checksum_size> result;
	std::copy_n (second.begin (), checksum_size, result.begin ());
	return result;
}
}

politeia::hash160_t politeia::hash160 (byte_vector const & data_a)
{
	auto inner (politeia::blake256::hash (data_a.data (), data_a.size ()));
	hash160_t result;
	unsigned size (0);
	auto success (EVP_Digest (inner.data (), inner.size (), result.data (), &size, EVP_ripemd160 (), nullptr));
	release_assert (success == 1 && size == result.size ());
	return result;
}

politeia::pubkey_hash_address::pubkey_hash_address (uint16_t net_id_a, hash160_t const & hash_a) :
net_id (net_id_a),
hash (hash_a)
{
}

politeia::pubkey_hash_address::pubkey_hash_address (network_params const & network_a, byte_vector const & public_key_a) :
net_id (network_a.pubkey_hash_addr_id),
hash (hash160 (public_key_a))
{
}

politeia::error politeia::pubkey_hash_address::decode (std::string const & text_a, network_params const & network_a)
{
	politeia::error result;
	byte_vector bytes;
	if (base58_decode (text_a, bytes))
	{
		result.set ("Address is not base58 encoded", politeia::error_plugin::invalid_address);
	}
	else if (bytes.size () != address_size)
	{
		result.set (boost::str (boost::format ("Address has an invalid length %1%") % bytes.size ()), politeia::error_plugin::invalid_address);
	}
	else if (checksum (bytes.data (), address_size - checksum_size) != std::array<uint8_t, checksum_size>{ { bytes[22], bytes[23], bytes[24], bytes[25] } })
	{
		result.set ("Address checksum mismatch", politeia::error_plugin::invalid_address);
	}
	else
	{
		uint16_t id ((static_cast<uint16_t> (bytes[0]) << 8) | bytes[1]);
		if (id == network_a.pubkey_hash_addr_id)
		{
			net_id = id;
			std::copy_n (bytes.begin () + 2, hash.size (), hash.begin ());
		}
		else if (id == network_a.pkh_edwards_addr_id || id == network_a.pkh_schnorr_addr_id || id == network_a.script_hash_addr_id || id == network_a.pubkey_addr_id)
		{
			result.set ("Not a pay-to-pubkey-hash address: " + text_a, politeia::error_plugin::invalid_address);
		}
		else
		{
			result.set (boost::str (boost::format ("Unknown address type for %1%: %2%") % network_a.name % text_a), politeia::error_plugin::invalid_address);
		}
	}
	return result;
}

std::string politeia::pubkey_hash_address::to_string () const
{
	byte_vector bytes;
	bytes.reserve (address_size);
	bytes.push_back (static_cast<uint8_t> (net_id >> 8));
	bytes.push_back (static_cast<uint8_t> (net_id));
	bytes.insert (bytes.end (), hash.begin (), hash.end ());
	auto sum (checksum (bytes.data (), bytes.size ()));
	bytes.insert (bytes.end (), sum.begin (), sum.end ());
	return base58_encode (bytes);
}

bool politeia::pubkey_hash_address::operator== (pubkey_hash_address const & other_a) const
{
	return net_id == other_a.net_id && hash == other_a.hash;
}
