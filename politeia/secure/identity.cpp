#include <politeia/lib/encoding.hpp>
#include <politeia/lib/jsonconfig.hpp>
#include <politeia/lib/utility.hpp>
#include <politeia/secure/identity.hpp>

#include <boost/filesystem/operations.hpp>

#include <openssl/evp.h>

#include <memory>

namespace
{
struct evp_pkey_deleter
{
	void operator() (EVP_PKEY * key_a) const
	{
		EVP_PKEY_free (key_a);
	}
};
struct evp_md_ctx_deleter
{
	void operator() (EVP_MD_CTX * ctx_a) const
	{
		EVP_MD_CTX_free (ctx_a);
	}
};
struct evp_pkey_ctx_deleter
{
	void operator() (EVP_PKEY_CTX * ctx_a) const
	{
		EVP_PKEY_CTX_free (ctx_a);
	}
};
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, evp_pkey_deleter>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;
using evp_pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, evp_pkey_ctx_deleter>;

evp_pkey_ptr private_pkey (std::array<uint8_t, 32> const & seed_a)
{
	return evp_pkey_ptr (EVP_PKEY_new_raw_private_key (EVP_PKEY_ED25519, nullptr, seed_a.data (), seed_a.size ()));
}

bool derive_public (std::array<uint8_t, 32> const & seed_a, politeia::ed25519_public_key & public_key_a)
{
	auto key (private_pkey (seed_a));
	auto size (public_key_a.size ());
	return key == nullptr || EVP_PKEY_get_raw_public_key (key.get (), public_key_a.data (), &size) != 1 || size != public_key_a.size ();
}

template <typename T>
bool decode_key (std::string const & text_a, T & key_a)
{
	politeia::byte_vector bytes;
	auto error (politeia::from_hex (text_a, bytes) || bytes.size () != key_a.size ());
	if (!error)
	{
		std::copy (bytes.begin (), bytes.end (), key_a.begin ());
	}
	return error;
}
}

politeia::identity politeia::identity::generate ()
{
	evp_pkey_ctx_ptr ctx (EVP_PKEY_CTX_new_id (EVP_PKEY_ED25519, nullptr));
	release_assert (ctx != nullptr);
	EVP_PKEY * raw_key (nullptr);
	auto success (EVP_PKEY_keygen_init (ctx.get ()) == 1 && EVP_PKEY_keygen (ctx.get (), &raw_key) == 1);
	release_assert (success);
	evp_pkey_ptr key (raw_key);
	identity result;
	auto public_size (result.public_key.size ());
	auto secret_size (result.secret_key.size ());
	success = EVP_PKEY_get_raw_public_key (key.get (), result.public_key.data (), &public_size) == 1;
	success = success && EVP_PKEY_get_raw_private_key (key.get (), result.secret_key.data (), &secret_size) == 1;
	release_assert (success && public_size == result.public_key.size () && secret_size == result.secret_key.size ());
	return result;
}

politeia::error politeia::identity::load_or_create (boost::filesystem::path const & path_a)
{
	politeia::error result;
	boost::system::error_code ec;
	if (!boost::filesystem::exists (path_a, ec))
	{
		*this = generate ();
		result = write (path_a);
	}
	else
	{
		politeia::jsonconfig json;
		result = json.read (path_a);
		if (!result)
		{
			std::string public_text;
			std::string secret_text;
			json.get_required ("public_key", public_text);
			json.get_required ("secret_key", secret_text);
			result = json.get_error ();
			ed25519_public_key derived;
			if (result)
			{
				result.set ("Identity file " + path_a.string () + ": " + result.get_message (), politeia::error_plugin::identity_missing);
			}
			else if (decode_key (public_text, public_key) || decode_key (secret_text, secret_key) || derive_public (secret_key, derived) || derived != public_key)
			{
				result.set ("Identity file " + path_a.string () + " does not hold a valid ed25519 key pair", politeia::error_plugin::identity_missing);
			}
		}
		else
		{
			result.set ("Unable to read identity file " + path_a.string () + ": " + result.get_message (), politeia::error_plugin::identity_missing);
		}
	}
	return result;
}

politeia::error politeia::identity::write (boost::filesystem::path const & path_a) const
{
	politeia::error result;
	try
	{
		politeia::jsonconfig json;
		json.put ("public_key", public_key_hex ());
		json.put ("secret_key", politeia::to_hex (secret_key.data (), secret_key.size ()));
		json.write (path_a);
		boost::system::error_code ec;
		politeia::set_secure_perm_file (path_a, ec);
		if (ec)
		{
			result = ec;
		}
	}
	catch (std::exception const & ex)
	{
		result = ex;
	}
	if (result)
	{
		result.set ("Unable to write identity file " + path_a.string () + ": " + result.get_message (), politeia::error_plugin::identity_missing);
	}
	return result;
}

politeia::ed25519_signature politeia::identity::sign (std::string const & message_a) const
{
	auto key (private_pkey (secret_key));
	evp_md_ctx_ptr ctx (EVP_MD_CTX_new ());
	release_assert (key != nullptr && ctx != nullptr);
	ed25519_signature result;
	auto size (result.size ());
	auto success (EVP_DigestSignInit (ctx.get (), nullptr, nullptr, nullptr, key.get ()) == 1);
	success = success && EVP_DigestSign (ctx.get (), result.data (), &size, reinterpret_cast<unsigned char const *> (message_a.data ()), message_a.size ()) == 1;
	release_assert (success && size == result.size ());
	return result;
}

std::string politeia::identity::public_key_hex () const
{
	return politeia::to_hex (public_key.data (), public_key.size ());
}

bool politeia::ed25519_verify (ed25519_public_key const & public_key_a, std::string const & message_a, ed25519_signature const & signature_a)
{
	evp_pkey_ptr key (EVP_PKEY_new_raw_public_key (EVP_PKEY_ED25519, nullptr, public_key_a.data (), public_key_a.size ()));
	evp_md_ctx_ptr ctx (EVP_MD_CTX_new ());
	auto valid (key != nullptr && ctx != nullptr);
	valid = valid && EVP_DigestVerifyInit (ctx.get (), nullptr, nullptr, nullptr, key.get ()) == 1;
	valid = valid && EVP_DigestVerify (ctx.get (), signature_a.data (), signature_a.size (), reinterpret_cast<unsigned char const *> (message_a.data ()), message_a.size ()) == 1;
	return valid;
}
