#include <politeia/lib/logger_mt.hpp>
#include <politeia/node/oracle.hpp>

#include <gtest/gtest.h>

TEST (dcrdata, parse_block)
{
	politeia::block_info block;
	ASSERT_FALSE (politeia::dcrdata::parse_block (R"({"height":305301,"size":5230,"hash":"00000000000000001d2f8b0c3ee9ac2d3fbd5c4f0da0f6a4c2b74edd73ba2d06","diff":1.0,"time":1546276521})", block));
	ASSERT_EQ (305301, block.height);
	ASSERT_EQ ("00000000000000001d2f8b0c3ee9ac2d3fbd5c4f0da0f6a4c2b74edd73ba2d06", block.hash);
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, politeia::dcrdata::parse_block (R"({"height":"tall","hash":"00"})", block).get_code ());
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, politeia::dcrdata::parse_block (R"({"height":1})", block).get_code ());
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, politeia::dcrdata::parse_block ("<html>", block).get_code ());
}

TEST (dcrdata, parse_ticket_pool)
{
	std::vector<std::string> tickets;
	ASSERT_FALSE (politeia::dcrdata::parse_ticket_pool (R"(["aa01","bb02","cc03"])", tickets));
	ASSERT_EQ ((std::vector<std::string>{ "aa01", "bb02", "cc03" }), tickets);
	ASSERT_FALSE (politeia::dcrdata::parse_ticket_pool ("null", tickets));
	ASSERT_TRUE (tickets.empty ());
	tickets.push_back ("aa01");
	ASSERT_FALSE (politeia::dcrdata::parse_ticket_pool ("[]", tickets));
	ASSERT_TRUE (tickets.empty ());
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, politeia::dcrdata::parse_ticket_pool (R"({"tickets":["aa01"]})", tickets).get_code ());
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, politeia::dcrdata::parse_ticket_pool (R"([["aa01"]])", tickets).get_code ());
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, politeia::dcrdata::parse_ticket_pool ("\"aa01\"", tickets).get_code ());
}

TEST (dcrdata, largest_commitment)
{
	auto body (R"({
		"txid": "ticket",
		"vout": [
			{ "value": 0.0, "n": 0, "scriptPubKey": { "type": "stakesubmission", "addresses": ["DsSubmission"] } },
			{ "value": 0.0, "n": 1, "scriptPubKey": { "type": "sstxcommitment", "addresses": ["DsSmall"], "commitamt": 1.5 } },
			{ "value": 0.0, "n": 2, "scriptPubKey": { "type": "sstxchange", "addresses": ["DsChange"] } },
			{ "value": 0.0, "n": 3, "scriptPubKey": { "type": "sstxcommitment", "addresses": ["DsLarge", "DsOther"], "commitamt": 98.25 } },
			{ "value": 0.0, "n": 4, "scriptPubKey": { "type": "sstxcommitment", "addresses": ["DsTie"], "commitamt": 98.25 } }
		]
	})");
	std::string address;
	ASSERT_FALSE (politeia::dcrdata::parse_largest_commitment_address (body, address));
	// Ties keep the first output
	ASSERT_EQ ("DsLarge", address);
	auto error (politeia::dcrdata::parse_largest_commitment_address (R"({"txid":"abc","vout":[{"scriptPubKey":{"addresses":["Ds1"]}}]})", address));
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, error.get_code ());
	ASSERT_NE (std::string::npos, error.get_message ().find ("No best commitment address found"));
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, politeia::dcrdata::parse_largest_commitment_address ("{", address).get_code ());
}

TEST (dcrdata, valid_argument)
{
	ASSERT_TRUE (politeia::dcrdata::valid_argument ("00ab12Ff"));
	ASSERT_FALSE (politeia::dcrdata::valid_argument (""));
	ASSERT_FALSE (politeia::dcrdata::valid_argument ("../block"));
	ASSERT_FALSE (politeia::dcrdata::valid_argument ("ab?c=1"));
}

TEST (service_url, parse)
{
	politeia::service_url url;
	ASSERT_FALSE (url.parse ("https://dcrdata.org:443/"));
	ASSERT_TRUE (url.secure);
	ASSERT_EQ ("dcrdata.org", url.host);
	ASSERT_EQ ("443", url.port);
	ASSERT_EQ ("/", url.path);
	ASSERT_FALSE (url.parse ("http://127.0.0.1:7777/insight"));
	ASSERT_FALSE (url.secure);
	ASSERT_EQ ("127.0.0.1", url.host);
	ASSERT_EQ ("7777", url.port);
	ASSERT_EQ ("/insight/", url.path);
	ASSERT_EQ ("http://127.0.0.1:7777/insight/", url.to_string ());
	ASSERT_FALSE (url.parse ("https://testnet.dcrdata.org"));
	ASSERT_EQ ("443", url.port);
	ASSERT_FALSE (url.parse ("http://localhost"));
	ASSERT_EQ ("80", url.port);
	ASSERT_TRUE (url.parse ("ftp://dcrdata.org/"));
	ASSERT_TRUE (url.parse ("https://:443/"));
	ASSERT_TRUE (url.parse ("https://dcrdata.org:port/"));
	ASSERT_TRUE (url.parse ("dcrdata.org"));
}

TEST (dcrdata_oracle, malformed_argument)
{
	politeia::service_url url;
	ASSERT_FALSE (url.parse ("http://127.0.0.1:1/"));
	politeia::logger_mt logger;
	politeia::dcrdata_oracle oracle (url, std::chrono::milliseconds (500), logger, false);
	std::vector<std::string> tickets;
	ASSERT_EQ (politeia::error_plugin::malformed_request, oracle.ticket_pool ("../../block/best", tickets).get_code ());
	std::string address;
	ASSERT_EQ (politeia::error_plugin::malformed_request, oracle.largest_commitment_address ("", address).get_code ());
}

TEST (dcrdata_oracle, unreachable)
{
	politeia::service_url url;
	// Port 1 on the loopback interface refuses connections
	ASSERT_FALSE (url.parse ("http://127.0.0.1:1/"));
	politeia::logger_mt logger;
	politeia::dcrdata_oracle oracle (url, std::chrono::milliseconds (2000), logger, true);
	politeia::block_info block;
	ASSERT_EQ (politeia::error_plugin::oracle_unavailable, oracle.best_block (block).get_code ());
}
