#include <politeia/lib/utility.hpp>
#include <politeia/secure/message_signature.hpp>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>

#include <memory>

namespace
{
struct bn_deleter
{
	void operator() (BIGNUM * bn_a) const
	{
		BN_clear_free (bn_a);
	}
};
struct bn_ctx_deleter
{
	void operator() (BN_CTX * ctx_a) const
	{
		BN_CTX_free (ctx_a);
	}
};
struct ec_point_deleter
{
	void operator() (EC_POINT * point_a) const
	{
		EC_POINT_clear_free (point_a);
	}
};
struct ec_group_deleter
{
	void operator() (EC_GROUP * group_a) const
	{
		EC_GROUP_free (group_a);
	}
};
using bn_ptr = std::unique_ptr<BIGNUM, bn_deleter>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, bn_ctx_deleter>;
using ec_point_ptr = std::unique_ptr<EC_POINT, ec_point_deleter>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, ec_group_deleter>;

size_t constexpr compact_signature_size = 65;
uint8_t constexpr compact_header_base = 27;
uint8_t constexpr compact_compressed_flag = 4;

/** Curve parameters, read-only after construction and shared by all threads */
class secp256k1_curve
{
public:
	secp256k1_curve () :
	group (EC_GROUP_new_by_curve_name (NID_secp256k1)),
	field (BN_new ()),
	half_order (BN_new ())
	{
		release_assert (group != nullptr && field != nullptr && half_order != nullptr);
		order = EC_GROUP_get0_order (group.get ());
		auto success (EC_GROUP_get_curve (group.get (), field.get (), nullptr, nullptr, nullptr));
		release_assert (success == 1);
		success = BN_rshift1 (half_order.get (), order);
		release_assert (success == 1);
	}
	ec_group_ptr group;
	BIGNUM const * order;
	bn_ptr field;
	bn_ptr half_order;
};

secp256k1_curve const & curve ()
{
	static secp256k1_curve const instance;
	return instance;
}

bn_ptr to_bn (uint8_t const * data_a, size_t size_a)
{
	bn_ptr result (BN_bin2bn (data_a, static_cast<int> (size_a), nullptr));
	release_assert (result != nullptr);
	return result;
}

bn_ptr new_bn ()
{
	bn_ptr result (BN_new ());
	release_assert (result != nullptr);
	return result;
}

politeia::byte_vector serialize_point (EC_POINT const * point_a, bool compressed_a, BN_CTX * ctx_a)
{
	auto form (compressed_a ? POINT_CONVERSION_COMPRESSED : POINT_CONVERSION_UNCOMPRESSED);
	politeia::byte_vector result (compressed_a ? 33 : 65);
	auto size (EC_POINT_point2oct (curve ().group.get (), point_a, form, result.data (), result.size (), ctx_a));
	release_assert (size == result.size ());
	return result;
}
}

politeia::blake256::digest politeia::signed_message_hash (std::string const & message_a)
{
	byte_vector payload;
	write_varstring (payload, "Decred Signed Message:\n");
	write_varstring (payload, message_a);
	return blake256::hash (payload.data (), payload.size ());
}

politeia::private_key politeia::private_key::generate ()
{
	private_key result;
	auto valid (false);
	while (!valid)
	{
		auto success (RAND_bytes (result.data.data (), static_cast<int> (result.data.size ())));
		release_assert (success == 1);
		auto scalar (to_bn (result.data.data (), result.data.size ()));
		valid = !BN_is_zero (scalar.get ()) && BN_cmp (scalar.get (), curve ().order) < 0;
	}
	return result;
}

bool politeia::private_key::decode_hex (std::string const & text_a)
{
	byte_vector bytes;
	auto error (from_hex (text_a, bytes) || bytes.size () != data.size ());
	if (!error)
	{
		auto scalar (to_bn (bytes.data (), bytes.size ()));
		error = BN_is_zero (scalar.get ()) || BN_cmp (scalar.get (), curve ().order) >= 0;
		if (!error)
		{
			std::copy (bytes.begin (), bytes.end (), data.begin ());
		}
	}
	return error;
}

std::string politeia::private_key::to_hex () const
{
	return politeia::to_hex (data.data (), data.size ());
}

politeia::byte_vector politeia::private_key::public_key (bool compressed_a) const
{
	auto & secp (curve ());
	bn_ctx_ptr ctx (BN_CTX_new ());
	auto scalar (to_bn (data.data (), data.size ()));
	ec_point_ptr point (EC_POINT_new (secp.group.get ()));
	release_assert (ctx != nullptr && point != nullptr);
	auto success (EC_POINT_mul (secp.group.get (), point.get (), scalar.get (), nullptr, nullptr, ctx.get ()));
	release_assert (success == 1);
	return serialize_point (point.get (), compressed_a, ctx.get ());
}

politeia::pubkey_hash_address politeia::private_key::address (network_params const & network_a, bool compressed_a) const
{
	return pubkey_hash_address (network_a, public_key (compressed_a));
}

politeia::byte_vector politeia::private_key::sign_compact (blake256::digest const & hash_a, bool compressed_a) const
{
	auto & secp (curve ());
	auto group (secp.group.get ());
	bn_ctx_ptr ctx (BN_CTX_new ());
	ec_point_ptr point (EC_POINT_new (group));
	release_assert (ctx != nullptr && point != nullptr);
	auto d (to_bn (data.data (), data.size ()));
	auto e (to_bn (hash_a.data (), hash_a.size ()));
	auto k (new_bn ());
	auto x (new_bn ());
	auto y (new_bn ());
	auto r (new_bn ());
	auto s (new_bn ());
	byte_vector result (compact_signature_size);
	auto done (false);
	while (!done)
	{
		auto success (BN_rand_range (k.get (), secp.order));
		release_assert (success == 1);
		if (BN_is_zero (k.get ()))
		{
			continue;
		}
		success = EC_POINT_mul (group, point.get (), k.get (), nullptr, nullptr, ctx.get ());
		success = success && EC_POINT_get_affine_coordinates (group, point.get (), x.get (), y.get (), ctx.get ());
		success = success && BN_nnmod (r.get (), x.get (), secp.order, ctx.get ());
		release_assert (success == 1);
		if (BN_is_zero (r.get ()))
		{
			continue;
		}
		// s = k^-1 (e + r d) mod n
		bn_ptr k_inverse (BN_mod_inverse (nullptr, k.get (), secp.order, ctx.get ()));
		release_assert (k_inverse != nullptr);
		success = BN_mod_mul (s.get (), r.get (), d.get (), secp.order, ctx.get ());
		success = success && BN_mod_add (s.get (), s.get (), e.get (), secp.order, ctx.get ());
		success = success && BN_mod_mul (s.get (), s.get (), k_inverse.get (), secp.order, ctx.get ());
		release_assert (success == 1);
		if (BN_is_zero (s.get ()))
		{
			continue;
		}
		uint8_t recovery_id ((BN_is_odd (y.get ()) ? 1 : 0) | (BN_cmp (x.get (), secp.order) >= 0 ? 2 : 0));
		if (BN_cmp (s.get (), secp.half_order.get ()) > 0)
		{
			// Negating s negates R, flipping the parity of its y coordinate
			success = BN_sub (s.get (), secp.order, s.get ());
			release_assert (success == 1);
			recovery_id ^= 1;
		}
		result[0] = compact_header_base + recovery_id + (compressed_a ? compact_compressed_flag : 0);
		BN_bn2binpad (r.get (), result.data () + 1, 32);
		BN_bn2binpad (s.get (), result.data () + 33, 32);
		done = true;
	}
	return result;
}

std::string politeia::sign_message (private_key const & key_a, std::string const & message_a, bool compressed_a)
{
	return base64_encode (key_a.sign_compact (signed_message_hash (message_a), compressed_a));
}

bool politeia::recover_compact (blake256::digest const & hash_a, byte_vector const & signature_a, byte_vector & public_key_a)
{
	auto error (signature_a.size () != compact_signature_size);
	if (!error)
	{
		error = signature_a[0] < compact_header_base || signature_a[0] >= compact_header_base + 8;
	}
	if (!error)
	{
		auto & secp (curve ());
		auto group (secp.group.get ());
		int recovery_id ((signature_a[0] - compact_header_base) & 3);
		auto compressed (((signature_a[0] - compact_header_base) & compact_compressed_flag) != 0);
		bn_ctx_ptr ctx (BN_CTX_new ());
		release_assert (ctx != nullptr);
		auto r (to_bn (signature_a.data () + 1, 32));
		auto s (to_bn (signature_a.data () + 33, 32));
		error = BN_is_zero (r.get ()) || BN_is_zero (s.get ()) || BN_cmp (r.get (), secp.order) >= 0 || BN_cmp (s.get (), secp.order) >= 0;
		// x coordinate of R is r + j n for j in {0, 1}
		auto x (new_bn ());
		if (!error)
		{
			auto success (BN_copy (x.get (), r.get ()) != nullptr);
			if (recovery_id & 2)
			{
				success = success && BN_add (x.get (), x.get (), secp.order);
			}
			release_assert (success);
			error = BN_cmp (x.get (), secp.field.get ()) >= 0;
		}
		ec_point_ptr big_r (EC_POINT_new (group));
		release_assert (big_r != nullptr);
		if (!error)
		{
			error = EC_POINT_set_compressed_coordinates (group, big_r.get (), x.get (), recovery_id & 1, ctx.get ()) != 1;
			if (error)
			{
				// x is not on the curve
				ERR_clear_error ();
			}
		}
		if (!error)
		{
			// Q = r^-1 (s R - e G)
			auto e (to_bn (hash_a.data (), hash_a.size ()));
			bn_ptr r_inverse (BN_mod_inverse (nullptr, r.get (), secp.order, ctx.get ()));
			release_assert (r_inverse != nullptr);
			auto u1 (new_bn ());
			auto u2 (new_bn ());
			auto success (BN_mod_sub (u1.get (), secp.order, e.get (), secp.order, ctx.get ()));
			success = success && BN_mod_mul (u1.get (), u1.get (), r_inverse.get (), secp.order, ctx.get ());
			success = success && BN_mod_mul (u2.get (), s.get (), r_inverse.get (), secp.order, ctx.get ());
			release_assert (success == 1);
			ec_point_ptr q (EC_POINT_new (group));
			release_assert (q != nullptr);
			success = EC_POINT_mul (group, q.get (), u1.get (), big_r.get (), u2.get (), ctx.get ());
			release_assert (success == 1);
			error = EC_POINT_is_at_infinity (group, q.get ()) == 1;
			if (!error)
			{
				public_key_a = serialize_point (q.get (), compressed, ctx.get ());
			}
		}
	}
	return error;
}

politeia::error politeia::verify_message (network_params const & network_a, std::string const & address_a, std::string const & message_a, std::string const & signature_a, bool & matched_a)
{
	matched_a = false;
	pubkey_hash_address address;
	auto result (address.decode (address_a, network_a));
	if (!result)
	{
		byte_vector signature;
		if (base64_decode (signature_a, signature))
		{
			result.set ("Malformed base64 signature", politeia::error_plugin::invalid_signature);
		}
		else
		{
			byte_vector public_key;
			if (!recover_compact (signed_message_hash (message_a), signature, public_key))
			{
				matched_a = pubkey_hash_address (network_a, public_key).to_string () == address_a;
			}
		}
	}
	return result;
}
