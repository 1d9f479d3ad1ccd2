#include <politeia/node/messages.hpp>

#include <boost/property_tree/ptree.hpp>

#include <gtest/gtest.h>

TEST (messages, vote_request)
{
	politeia::vote_request request;
	ASSERT_FALSE (politeia::decode_vote_request (R"({"token":"abcd","mask":"3","options":[{"id":"no","description":"Don't approve","bits":1},{"id":"yes","description":"Approve","bits":"2"}]})", request));
	ASSERT_EQ ("abcd", request.token);
	ASSERT_EQ (3, request.mask);
	ASSERT_EQ (2, request.options.size ());
	ASSERT_EQ ("yes", request.options[1].id);
	ASSERT_EQ (2, request.options[1].bits);
	ASSERT_FALSE (request.validate_bits ());
}

TEST (messages, vote_request_malformed)
{
	politeia::vote_request request;
	ASSERT_EQ (politeia::error_plugin::malformed_request, politeia::decode_vote_request ("", request).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, politeia::decode_vote_request (R"({"token":"ab","mask":"-1","options":[]})", request).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, politeia::decode_vote_request (R"({"token":"ab","mask":3,"options":{"id":"no"}})", request).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, politeia::decode_vote_request (R"({"token":{"a":"b"},"mask":3})", request).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, politeia::decode_vote_request (R"({"token":"ab","mask":3,"options":[{"id":"no","bits":"x"}]})", request).get_code ());
}

TEST (messages, validate_bits)
{
	politeia::vote_request request;
	request.mask = 0x3;
	ASSERT_EQ (politeia::error_plugin::invalid_vote_bits, request.validate_bits ().get_code ());
	request.options.push_back ({ "no", "", 0x1 });
	request.options.push_back ({ "yes", "", 0x2 });
	ASSERT_FALSE (request.validate_bits ());
	request.options.push_back ({ "yes", "", 0x1 });
	ASSERT_EQ (politeia::error_plugin::invalid_vote_bits, request.validate_bits ().get_code ());
	request.options.back ().id = "abstain";
	request.options.back ().bits = 0x4;
	ASSERT_EQ (politeia::error_plugin::invalid_vote_bits, request.validate_bits ().get_code ());
	request.options.back ().bits = 0;
	ASSERT_EQ (politeia::error_plugin::invalid_vote_bits, request.validate_bits ().get_code ());
}

TEST (messages, start_vote_reply)
{
	politeia::start_vote_reply reply;
	reply.start_block_height = 282893;
	reply.start_block_hash = "000000000000000022c5a1bd7c08ad6c2fd7c1e2dc37bb7e5d1ba5e2de1b3e33";
	reply.end_height = 284909;
	reply.eligible_tickets = { "aa", "bb" };
	auto encoded (politeia::encode_start_vote_reply (reply));
	ASSERT_EQ (R"({"startblockheight":"282893","startblockhash":"000000000000000022c5a1bd7c08ad6c2fd7c1e2dc37bb7e5d1ba5e2de1b3e33","endheight":"284909","eligibletickets":["aa","bb"]})", encoded);
	politeia::start_vote_reply decoded;
	ASSERT_FALSE (politeia::decode_start_vote_reply (encoded, decoded));
	ASSERT_EQ (reply.eligible_tickets, decoded.eligible_tickets);
	ASSERT_EQ (reply.end_height, decoded.end_height);
}

TEST (messages, start_vote_reply_empty_electorate)
{
	politeia::start_vote_reply reply;
	reply.start_block_hash = "00";
	auto encoded (politeia::encode_start_vote_reply (reply));
	politeia::start_vote_reply decoded;
	decoded.eligible_tickets.push_back ("stale");
	ASSERT_FALSE (politeia::decode_start_vote_reply (encoded, decoded));
	ASSERT_TRUE (decoded.eligible_tickets.empty ());
	ASSERT_FALSE (politeia::decode_start_vote_reply (R"({"startblockheight":"1","startblockhash":"00","endheight":"2","eligibletickets":[]})", decoded));
	ASSERT_TRUE (decoded.eligible_tickets.empty ());
}

TEST (messages, cast_votes)
{
	std::vector<politeia::cast_vote> votes;
	std::vector<politeia::cast_vote_reply> replies;
	ASSERT_FALSE (politeia::decode_cast_votes (R"([{"token":"ab","ticket":"cd","votebit":"1","signature":"1f"},{"token":"ab","ticket":"ef","votebit":"2","signature":"20"}])", votes));
	ASSERT_EQ (2, votes.size ());
	ASSERT_EQ ("abef2", votes[1].message ());
	ASSERT_EQ (R"([{"token":"ab","ticket":"cd","votebit":"1","signature":"1f"},{"token":"ab","ticket":"ef","votebit":"2","signature":"20"}])", politeia::encode_cast_votes (votes));
	ASSERT_EQ ("[]", politeia::encode_cast_votes ({}));
	ASSERT_FALSE (politeia::decode_cast_votes (" []", votes));
	ASSERT_TRUE (votes.empty ());
	votes.resize (2);
	ASSERT_EQ (politeia::error_plugin::malformed_request, politeia::decode_cast_votes (R"({"token":"ab"})", votes).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, politeia::decode_cast_votes (R"([{"token":["ab"]}])", votes).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, politeia::decode_cast_votes (R"(["ab"])", votes).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, politeia::decode_cast_votes ("{}", votes).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, politeia::decode_cast_votes (R"("")", votes).get_code ());
	ASSERT_EQ (politeia::error_plugin::malformed_request, politeia::decode_cast_vote_replies ("{}", replies).get_code ());
	ASSERT_EQ (2, votes.size ());
}

TEST (messages, cast_vote_replies)
{
	std::vector<politeia::cast_vote_reply> replies (2);
	replies[0].client_signature = "1f";
	replies[0].signature = "aa";
	replies[1].error = "duplicate vote token ab ticket cd";
	auto encoded (politeia::encode_cast_vote_replies (replies));
	ASSERT_EQ (R"([{"clientsignature":"1f","signature":"aa","error":""},{"clientsignature":"","signature":"","error":"duplicate vote token ab ticket cd"}])", encoded);
	std::vector<politeia::cast_vote_reply> decoded;
	ASSERT_FALSE (politeia::decode_cast_vote_replies (encoded, decoded));
	ASSERT_EQ (2, decoded.size ());
	ASSERT_EQ (replies[1].error, decoded[1].error);
}
