#include <politeia/secure/address.hpp>
#include <politeia/secure/message_signature.hpp>

#include <gtest/gtest.h>

namespace
{
std::string const key_hex ("40869fd1ac5f783991d6b4d7ea7bbf3b95b3a8c84ec101a9c5e743e71657ed20");
std::string const mainnet_address ("DsgLXPbVkim9BZe3AvM5Ux1bfj5xJ3umTRf");
std::string const mainnet_address_uncompressed ("DsoKL5hyPzS9qyT5EXnPdfC44NYcVDuZHmb");
std::string const message ("abc123T11");
std::string const signature ("H7tQ4tiaTtcGY9CAZZ/grUubw+BsF6InQzlmy1nO7gINXrGzbrDZEIC65emVUpzsgx8pPS0CKNX8HpTodP6xOcg=");
std::string const signature_uncompressed ("G7tQ4tiaTtcGY9CAZZ/grUubw+BsF6InQzlmy1nO7gINXrGzbrDZEIC65emVUpzsgx8pPS0CKNX8HpTodP6xOcg=");

politeia::private_key test_key ()
{
	politeia::private_key result;
	auto error (result.decode_hex (key_hex));
	EXPECT_FALSE (error);
	return result;
}
}

TEST (private_key, decode_hex)
{
	politeia::private_key key;
	ASSERT_FALSE (key.decode_hex (key_hex));
	ASSERT_EQ (key_hex, key.to_hex ());
	ASSERT_TRUE (key.decode_hex ("00"));
	ASSERT_TRUE (key.decode_hex (std::string (64, '0')));
	// The group order is not a valid scalar
	ASSERT_TRUE (key.decode_hex ("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"));
}

TEST (private_key, public_key)
{
	auto key (test_key ());
	ASSERT_EQ ("0292cb4bfebe8fd03b674533219cc7c17f8aaba34eed23b1a6620cd98f1683fa10", politeia::to_hex (key.public_key ()));
	ASSERT_EQ (65, key.public_key (false).size ());
	ASSERT_EQ (4, key.public_key (false)[0]);
}

TEST (address, encode)
{
	auto key (test_key ());
	politeia::network_params mainnet (politeia::dcr_networks::mainnet);
	politeia::network_params testnet (politeia::dcr_networks::testnet);
	politeia::network_params simnet (politeia::dcr_networks::simnet);
	ASSERT_EQ (mainnet_address, key.address (mainnet).to_string ());
	ASSERT_EQ (mainnet_address_uncompressed, key.address (mainnet, false).to_string ());
	ASSERT_EQ ("TsgPkNj19WpFHvKPzJyEdX2sFq3srkRz5Np", key.address (testnet).to_string ());
	ASSERT_EQ ("TsoNZ4qUnnVFxL8S3vQYnEDKeUWY3rjpRea", key.address (testnet, false).to_string ());
	ASSERT_EQ ("Ssjitb65fGqX89uKWnZGjgyfyCQn2JzJJ4g", key.address (simnet).to_string ());
	ASSERT_EQ ("SsrhhHCZJYWXnZiMaPzatQA8MqsSDYh9VhU", key.address (simnet, false).to_string ());
}

TEST (address, decode)
{
	auto key (test_key ());
	politeia::network_params mainnet (politeia::dcr_networks::mainnet);
	politeia::pubkey_hash_address address;
	ASSERT_FALSE (address.decode (mainnet_address, mainnet));
	ASSERT_EQ (key.address (mainnet), address);
	ASSERT_EQ (mainnet.pubkey_hash_addr_id, address.net_id);
}

TEST (address, decode_errors)
{
	politeia::network_params mainnet (politeia::dcr_networks::mainnet);
	politeia::network_params testnet (politeia::dcr_networks::testnet);
	politeia::pubkey_hash_address address;
	// Pay-to-script-hash
	ASSERT_EQ (politeia::error_plugin::invalid_address, address.decode ("DcpfguHR36u31FEXT1SfQuPns7JcqupVpJA", mainnet).get_code ());
	ASSERT_EQ (politeia::error_plugin::invalid_address, address.decode ("ZLPDwDtXpwby5V4meZmHB3jLhpvqgSXALG1", mainnet).get_code ());
	// Valid address of another network
	ASSERT_EQ (politeia::error_plugin::invalid_address, address.decode (mainnet_address, testnet).get_code ());
	ASSERT_EQ (politeia::error_plugin::invalid_address, address.decode ("DsgLXPbVkim9BZe3AvM5Ux1bfj5xJ3umTRg", mainnet).get_code ());
	ASSERT_EQ (politeia::error_plugin::invalid_address, address.decode ("Dsg0", mainnet).get_code ());
	ASSERT_EQ (politeia::error_plugin::invalid_address, address.decode ("", mainnet).get_code ());
}

TEST (message_signature, hash)
{
	auto hash (politeia::signed_message_hash (message));
	ASSERT_EQ ("b0046a4a90071962fb0ae0c22a43d652cf703d0d358427b9b5990fe7278a3b79", politeia::to_hex (hash.data (), hash.size ()));
}

TEST (message_signature, verify_known)
{
	politeia::network_params mainnet (politeia::dcr_networks::mainnet);
	auto matched (false);
	ASSERT_FALSE (politeia::verify_message (mainnet, mainnet_address, message, signature, matched));
	ASSERT_TRUE (matched);
	ASSERT_FALSE (politeia::verify_message (mainnet, mainnet_address_uncompressed, message, signature_uncompressed, matched));
	ASSERT_TRUE (matched);
	// The compression flag selects which serialization is hashed into the address
	ASSERT_FALSE (politeia::verify_message (mainnet, mainnet_address_uncompressed, message, signature, matched));
	ASSERT_FALSE (matched);
}

TEST (message_signature, recover)
{
	auto key (test_key ());
	politeia::byte_vector signature_bytes;
	ASSERT_FALSE (politeia::base64_decode (signature, signature_bytes));
	ASSERT_EQ ("1fbb50e2d89a4ed70663d080659fe0ad4b9bc3e06c17a227433966cb59ceee020d5eb1b36eb0d91080bae5e995529cec831f293d2d0228d5fc1e94e874feb139c8", politeia::to_hex (signature_bytes));
	politeia::byte_vector public_key;
	ASSERT_FALSE (politeia::recover_compact (politeia::signed_message_hash (message), signature_bytes, public_key));
	ASSERT_EQ (key.public_key (), public_key);
}

TEST (message_signature, tampered)
{
	politeia::network_params mainnet (politeia::dcr_networks::mainnet);
	auto matched (true);
	ASSERT_FALSE (politeia::verify_message (mainnet, mainnet_address, "abc123T12", signature, matched));
	ASSERT_FALSE (matched);
	auto other (politeia::private_key::generate ());
	matched = true;
	ASSERT_FALSE (politeia::verify_message (mainnet, other.address (mainnet).to_string (), message, signature, matched));
	ASSERT_FALSE (matched);
	politeia::byte_vector signature_bytes;
	ASSERT_FALSE (politeia::base64_decode (signature, signature_bytes));
	signature_bytes[10] ^= 0x01;
	matched = true;
	auto error (politeia::verify_message (mainnet, mainnet_address, message, politeia::base64_encode (signature_bytes), matched));
	ASSERT_TRUE (!error || error.get_code () == politeia::error_plugin::invalid_signature);
	ASSERT_FALSE (!error && matched);
}

TEST (message_signature, malformed)
{
	politeia::network_params mainnet (politeia::dcr_networks::mainnet);
	auto matched (false);
	ASSERT_EQ (politeia::error_plugin::invalid_signature, politeia::verify_message (mainnet, mainnet_address, message, "not base64", matched).get_code ());
	// Well formed base64 of the wrong length recovers no key
	matched = true;
	ASSERT_FALSE (politeia::verify_message (mainnet, mainnet_address, message, "Zm9v", matched));
	ASSERT_FALSE (matched);
	ASSERT_EQ (politeia::error_plugin::invalid_address, politeia::verify_message (mainnet, "DcpfguHR36u31FEXT1SfQuPns7JcqupVpJA", message, signature, matched).get_code ());
	politeia::byte_vector public_key;
	politeia::byte_vector bad_header (65, 0);
	ASSERT_TRUE (politeia::recover_compact (politeia::signed_message_hash (message), bad_header, public_key));
}

TEST (message_signature, sign_verify)
{
	politeia::network_params testnet (politeia::dcr_networks::testnet);
	for (auto compressed : { true, false })
	{
		auto key (politeia::private_key::generate ());
		auto address (key.address (testnet, compressed).to_string ());
		auto signature_l (politeia::sign_message (key, "vote", compressed));
		auto matched (false);
		ASSERT_FALSE (politeia::verify_message (testnet, address, "vote", signature_l, matched));
		ASSERT_TRUE (matched);
		ASSERT_FALSE (politeia::verify_message (testnet, address, "vote!", signature_l, matched));
		ASSERT_FALSE (matched);
	}
}
