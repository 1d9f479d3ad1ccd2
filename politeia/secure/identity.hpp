#pragma once

#include <politeia/lib/errors.hpp>

#include <boost/filesystem/path.hpp>

#include <array>
#include <string>

namespace politeia
{
using ed25519_public_key = std::array<uint8_t, 32>;
using ed25519_signature = std::array<uint8_t, 64>;

/** Ed25519 key pair used to counter-sign accepted votes */
class identity
{
public:
	static identity generate ();
	/**
	 * Reads the key pair stored as {"public_key", "secret_key"} in hex at \p path_a, or generates
	 * and stores a new one with owner-only permissions if the file does not exist.
	 * @return error_plugin::identity_missing if the file cannot be read or holds an invalid key pair
	 */
	politeia::error load_or_create (boost::filesystem::path const & path_a);
	politeia::error write (boost::filesystem::path const & path_a) const;
	ed25519_signature sign (std::string const & message_a) const;
	std::string public_key_hex () const;

	ed25519_public_key public_key{};
	/** The 32 byte seed the private scalar is derived from */
	std::array<uint8_t, 32> secret_key{};
};

bool ed25519_verify (ed25519_public_key const & public_key_a, std::string const & message_a, ed25519_signature const & signature_a);
}
