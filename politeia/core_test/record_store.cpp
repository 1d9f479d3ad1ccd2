#include <politeia/core_test/testutil.hpp>
#include <politeia/node/record_store.hpp>
#include <politeia/secure/utility.hpp>

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

#include <fstream>

TEST (file_record_store, vote_allowed)
{
	politeia::file_record_store records (politeia::unique_path ());
	auto token (politeia::test_hash (1));
	ASSERT_EQ (politeia::error_record::record_not_found, records.check_vote_allowed (token).get_code ());
	ASSERT_FALSE (records.set_status (token, "unreviewed"));
	ASSERT_EQ (politeia::error_record::record_not_public, records.check_vote_allowed (token).get_code ());
	ASSERT_FALSE (records.set_status (token, politeia::file_record_store::status_public));
	ASSERT_FALSE (records.check_vote_allowed (token));
}

TEST (file_record_store, token_must_be_hex)
{
	politeia::file_record_store records (politeia::unique_path ());
	ASSERT_EQ (politeia::error_record::record_not_found, records.set_status ("../x", "public").get_code ());
	ASSERT_EQ (politeia::error_record::record_not_found, records.check_vote_allowed ("../x").get_code ());
}

TEST (file_record_store, metadata)
{
	auto path (politeia::unique_path ());
	auto token (politeia::test_hash (2));
	{
		politeia::file_record_store records (path);
		ASSERT_FALSE (records.set_status (token, politeia::file_record_store::status_public));
		boost::optional<std::string> payload;
		ASSERT_FALSE (records.metadata (token, 13, payload));
		ASSERT_FALSE (payload);
		ASSERT_FALSE (records.update_vetted_metadata (token, {}, { { 13, "{\"mask\":3}" }, { 14, "snapshot" } }));
		ASSERT_FALSE (boost::filesystem::exists (records.record_path (token).string () + ".tmp"));
	}
	politeia::file_record_store records (path);
	boost::optional<std::string> payload;
	ASSERT_FALSE (records.metadata (token, 13, payload));
	ASSERT_TRUE (payload);
	ASSERT_EQ ("{\"mask\":3}", *payload);
	ASSERT_FALSE (records.update_vetted_metadata (token, { 13 }, { { 15, "x" } }));
	ASSERT_FALSE (records.metadata (token, 13, payload));
	ASSERT_FALSE (payload);
	ASSERT_FALSE (records.metadata (token, 14, payload));
	ASSERT_EQ ("snapshot", *payload);
	// The status survives metadata updates
	ASSERT_FALSE (records.check_vote_allowed (token));
}

TEST (file_record_store, unreadable_record)
{
	auto path (politeia::unique_path ());
	auto token (politeia::test_hash (3));
	politeia::file_record_store records (path);
	boost::filesystem::create_directories (records.record_path (token).parent_path ());
	{
		std::ofstream stream (records.record_path (token).string ());
		stream << "{";
	}
	ASSERT_EQ (politeia::error_record::record_io, records.check_vote_allowed (token).get_code ());
	ASSERT_EQ (politeia::error_record::record_io, records.update_vetted_metadata (token, {}, { { 13, "x" } }).get_code ());
}
