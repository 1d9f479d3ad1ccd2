#include <politeia/secure/identity.hpp>
#include <politeia/secure/utility.hpp>

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

#include <fstream>

TEST (identity, sign_verify)
{
	auto identity (politeia::identity::generate ());
	auto signature (identity.sign ("client signature"));
	ASSERT_TRUE (politeia::ed25519_verify (identity.public_key, "client signature", signature));
	ASSERT_FALSE (politeia::ed25519_verify (identity.public_key, "client signature!", signature));
	signature[0] ^= 1;
	ASSERT_FALSE (politeia::ed25519_verify (identity.public_key, "client signature", signature));
	ASSERT_EQ (64, identity.public_key_hex ().size ());
}

TEST (identity, load_or_create)
{
	auto path (politeia::unique_path ());
	boost::filesystem::create_directories (path);
	auto file (path / "identity.json");
	politeia::identity created;
	ASSERT_FALSE (created.load_or_create (file));
	ASSERT_TRUE (boost::filesystem::exists (file));
	auto perms (boost::filesystem::status (file).permissions ());
	ASSERT_EQ (boost::filesystem::owner_read | boost::filesystem::owner_write, perms);
	politeia::identity loaded;
	ASSERT_FALSE (loaded.load_or_create (file));
	ASSERT_EQ (created.public_key, loaded.public_key);
	ASSERT_EQ (created.secret_key, loaded.secret_key);
	// Deterministic signatures show the same private key
	ASSERT_EQ (created.sign ("message"), loaded.sign ("message"));
}

TEST (identity, mismatched_keys)
{
	auto path (politeia::unique_path ());
	boost::filesystem::create_directories (path);
	auto file (path / "identity.json");
	auto first (politeia::identity::generate ());
	auto second (politeia::identity::generate ());
	first.public_key = second.public_key;
	ASSERT_FALSE (first.write (file));
	politeia::identity loaded;
	ASSERT_EQ (politeia::error_plugin::identity_missing, loaded.load_or_create (file).get_code ());
}

TEST (identity, corrupt_file)
{
	auto path (politeia::unique_path ());
	boost::filesystem::create_directories (path);
	auto file (path / "identity.json");
	{
		std::ofstream stream (file.string ());
		stream << "{ \"public_key\": \"00\" ";
	}
	politeia::identity loaded;
	ASSERT_EQ (politeia::error_plugin::identity_missing, loaded.load_or_create (file).get_code ());
	{
		std::ofstream stream (file.string ());
		stream << "{ \"public_key\": \"00\" }";
	}
	ASSERT_EQ (politeia::error_plugin::identity_missing, loaded.load_or_create (file).get_code ());
}
