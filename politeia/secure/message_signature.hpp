#pragma once

#include <politeia/crypto_lib/blake256.hpp>
#include <politeia/lib/encoding.hpp>
#include <politeia/lib/errors.hpp>
#include <politeia/secure/address.hpp>

#include <array>
#include <string>

namespace politeia
{
/** BLAKE-256 of varstring ("Decred Signed Message:\n") followed by varstring (\p message_a) */
blake256::digest signed_message_hash (std::string const & message_a);

/** A secp256k1 private key */
class private_key
{
public:
	/** Generates a random key */
	static private_key generate ();
	/** @return true if \p text_a is not the hex of a scalar in [1, n) */
	bool decode_hex (std::string const & text_a);
	std::string to_hex () const;
	/** SEC1 serialized public key */
	byte_vector public_key (bool compressed_a = true) const;
	pubkey_hash_address address (network_params const & network_a, bool compressed_a = true) const;
	/**
	 * Signs \p hash_a with a low-S signature
	 * @return 65 byte compact signature, header byte 27 + recovery id (+ 4 if compressed) followed by r and s
	 */
	byte_vector sign_compact (blake256::digest const & hash_a, bool compressed_a = true) const;

	std::array<uint8_t, 32> data{};
};

/** Base64 compact signature over signed_message_hash (\p message_a) */
std::string sign_message (private_key const & key_a, std::string const & message_a, bool compressed_a = true);

/**
 * Recovers the public key which produced the compact \p signature_a over \p hash_a
 * @return true if no key can be recovered
 */
bool recover_compact (blake256::digest const & hash_a, byte_vector const & signature_a, byte_vector & public_key_a);

/**
 * Checks that the base64 compact \p signature_a over \p message_a was made by the owner of the
 * pay-to-pubkey-hash \p address_a. Safe to call concurrently.
 * @return error_plugin::invalid_address or error_plugin::invalid_signature if an input is malformed, otherwise
 * \p matched_a tells whether the recovered key belongs to the address
 */
politeia::error verify_message (network_params const & network_a, std::string const & address_a, std::string const & message_a, std::string const & signature_a, bool & matched_a);
}
