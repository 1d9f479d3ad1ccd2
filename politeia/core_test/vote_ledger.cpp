#include <politeia/core_test/testutil.hpp>
#include <politeia/node/messages.hpp>
#include <politeia/node/vote_ledger.hpp>
#include <politeia/node/write_lock.hpp>
#include <politeia/secure/utility.hpp>

#include <boost/filesystem.hpp>
#include <boost/property_tree/ptree.hpp>

#include <gtest/gtest.h>

#include <fstream>

namespace
{
politeia::cast_vote ledger_vote (std::string const & token_a, uint64_t ticket_a)
{
	politeia::cast_vote result;
	result.token = token_a;
	result.ticket = politeia::test_hash (ticket_a);
	result.vote_bit = "1";
	result.signature = "1f00";
	return result;
}

std::vector<std::string> read_lines (boost::filesystem::path const & path_a)
{
	std::vector<std::string> result;
	std::ifstream stream (path_a.string ());
	std::string line;
	while (std::getline (stream, line))
	{
		result.push_back (line);
	}
	return result;
}

void append_line (boost::filesystem::path const & path_a, std::string const & line_a)
{
	boost::filesystem::create_directories (path_a.parent_path ());
	std::ofstream stream (path_a.string (), std::ios_base::app);
	stream << line_a << '\n';
}

std::string encode (politeia::cast_vote const & vote_a)
{
	boost::property_tree::ptree tree;
	vote_a.serialize_json (tree);
	return politeia::to_json (tree);
}
}

TEST (vote_ledger, append_replay)
{
	auto path (politeia::unique_path ());
	auto token (politeia::test_hash (1));
	boost::filesystem::create_directories (path / token);
	politeia::write_lock write_lock;
	boost::optional<politeia::write_guard> guard;
	ASSERT_FALSE (write_lock.acquire (std::chrono::milliseconds (100), guard));
	{
		politeia::vote_ledger ledger (path, token);
		ASSERT_FALSE (ledger.open ());
		ASSERT_FALSE (ledger.replay ());
		ASSERT_EQ (0, ledger.size ());
		ASSERT_FALSE (ledger.append (*guard, ledger_vote (token, 10)));
		ASSERT_FALSE (ledger.append (*guard, ledger_vote (token, 11)));
		ASSERT_TRUE (ledger.contains (politeia::test_hash (10)));
		// Appends reach the file before append returns
		auto lines (read_lines (ledger.path ()));
		ASSERT_EQ (2, lines.size ());
		ASSERT_EQ (encode (ledger_vote (token, 10)), lines[0]);
	}
	politeia::vote_ledger ledger (path, token);
	ASSERT_FALSE (ledger.open ());
	ASSERT_FALSE (ledger.replay ());
	ASSERT_EQ (2, ledger.size ());
	ASSERT_TRUE (ledger.contains (politeia::test_hash (11)));
	ASSERT_FALSE (ledger.contains (politeia::test_hash (12)));
	ASSERT_EQ (path / token / "votes", ledger.path ());
}

TEST (vote_ledger, append_after_replay)
{
	auto path (politeia::unique_path ());
	auto token (politeia::test_hash (2));
	append_line (politeia::vote_ledger::ledger_path (path, token), encode (ledger_vote (token, 20)));
	politeia::write_lock write_lock;
	boost::optional<politeia::write_guard> guard;
	ASSERT_FALSE (write_lock.acquire (std::chrono::milliseconds (100), guard));
	politeia::vote_ledger ledger (path, token);
	ASSERT_FALSE (ledger.open ());
	ASSERT_FALSE (ledger.replay ());
	ASSERT_EQ (1, ledger.size ());
	ASSERT_FALSE (ledger.append (*guard, ledger_vote (token, 21)));
	ASSERT_FALSE (ledger.replay ());
	ASSERT_EQ (2, ledger.size ());
	ASSERT_EQ (2, read_lines (ledger.path ()).size ());
}

TEST (vote_ledger, corrupt_line)
{
	auto path (politeia::unique_path ());
	auto token (politeia::test_hash (3));
	auto file (politeia::vote_ledger::ledger_path (path, token));
	append_line (file, encode (ledger_vote (token, 30)));
	append_line (file, "{\"token\":");
	politeia::vote_ledger ledger (path, token);
	ASSERT_FALSE (ledger.open ());
	ASSERT_EQ (politeia::error_plugin::ledger_corrupt, ledger.replay ().get_code ());
}

TEST (vote_ledger, foreign_token)
{
	auto path (politeia::unique_path ());
	auto token (politeia::test_hash (4));
	append_line (politeia::vote_ledger::ledger_path (path, token), encode (ledger_vote (politeia::test_hash (5), 40)));
	politeia::vote_ledger ledger (path, token);
	ASSERT_FALSE (ledger.open ());
	ASSERT_EQ (politeia::error_plugin::ledger_corrupt, ledger.replay ().get_code ());
}

TEST (vote_ledger, repeated_ticket)
{
	auto path (politeia::unique_path ());
	auto token (politeia::test_hash (6));
	auto file (politeia::vote_ledger::ledger_path (path, token));
	append_line (file, encode (ledger_vote (token, 60)));
	append_line (file, encode (ledger_vote (token, 60)));
	politeia::vote_ledger ledger (path, token);
	ASSERT_FALSE (ledger.open ());
	ASSERT_EQ (politeia::error_plugin::ledger_corrupt, ledger.replay ().get_code ());
}

TEST (vote_ledger, open_failure)
{
	auto path (politeia::unique_path ());
	auto token (politeia::test_hash (7));
	// A file where the token directory should be
	boost::filesystem::create_directories (path);
	{
		std::ofstream stream ((path / token).string ());
		stream << "x";
	}
	politeia::vote_ledger ledger (path, token);
	ASSERT_EQ (politeia::error_plugin::ledger_io, ledger.open ().get_code ());
}

TEST (vote_ledger, missing_record)
{
	auto path (politeia::unique_path ());
	auto token (politeia::test_hash (8));
	boost::filesystem::create_directories (path);
	politeia::vote_ledger ledger (path, token);
	ASSERT_EQ (politeia::error_record::record_not_found, ledger.open ().get_code ());
	ASSERT_FALSE (boost::filesystem::exists (path / token));
}
