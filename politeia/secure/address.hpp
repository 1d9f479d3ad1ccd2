#pragma once

#include <politeia/lib/encoding.hpp>
#include <politeia/lib/errors.hpp>
#include <politeia/secure/network.hpp>

#include <array>
#include <string>

namespace politeia
{
using hash160_t = std::array<uint8_t, 20>;

/** RIPEMD-160 of the BLAKE-256 hash of \p data_a */
hash160_t hash160 (byte_vector const & data_a);

/** A decoded secp256k1 pay-to-pubkey-hash address */
class pubkey_hash_address
{
public:
	pubkey_hash_address () = default;
	pubkey_hash_address (uint16_t net_id_a, hash160_t const & hash_a);
	/** Address of a serialized secp256k1 public key on \p network_a */
	pubkey_hash_address (network_params const & network_a, byte_vector const & public_key_a);

	/**
	 * Decodes base58check \p text_a and checks it is a pay-to-pubkey-hash address of \p network_a
	 * @return error_plugin::invalid_address with a message describing the defect
	 */
	politeia::error decode (std::string const & text_a, network_params const & network_a);
	std::string to_string () const;
	bool operator== (pubkey_hash_address const &) const;

	uint16_t net_id{ 0 };
	hash160_t hash{};
};
}
