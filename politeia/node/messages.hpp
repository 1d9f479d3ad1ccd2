#pragma once

#include <politeia/lib/errors.hpp>

#include <boost/property_tree/ptree_fwd.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace politeia
{
/** Plugin identity and metadata stream ids */
class decred_plugin_constants final
{
public:
	static std::string const id;
	static std::string const version;
	static std::string const cmd_start_vote;
	static std::string const cmd_cast_votes;
	static std::string const cmd_best_block;
	/** Stream holding the vote request payload */
	static uint32_t const md_stream_vote_bits;
	/** Stream holding the start vote reply */
	static uint32_t const md_stream_vote_snapshot;
};

class vote_option final
{
public:
	std::string id;
	std::string description;
	uint64_t bits{ 0 };
};

/** Request to start voting on a proposal */
class vote_request final
{
public:
	politeia::error deserialize_json (boost::property_tree::ptree const & tree_a);
	void serialize_json (boost::property_tree::ptree & tree_a) const;
	/** @return error_plugin::invalid_vote_bits unless the mask and every option's bits are usable */
	politeia::error validate_bits () const;
	std::string token;
	uint64_t mask{ 0 };
	std::vector<politeia::vote_option> options;
};

/** A started vote: the snapshot block, the last block voting is open and the electorate */
class start_vote_reply final
{
public:
	politeia::error deserialize_json (boost::property_tree::ptree const & tree_a);
	void serialize_json (boost::property_tree::ptree & tree_a) const;
	uint64_t start_block_height{ 0 };
	std::string start_block_hash;
	uint64_t end_height{ 0 };
	std::vector<std::string> eligible_tickets;
};

/** A ticket's vote, signed by the ticket's largest commitment address over token + ticket + vote_bit */
class cast_vote final
{
public:
	politeia::error deserialize_json (boost::property_tree::ptree const & tree_a);
	void serialize_json (boost::property_tree::ptree & tree_a) const;
	/** The signed message */
	std::string message () const;
	std::string token;
	std::string ticket;
	std::string vote_bit;
	/** Hex of a 65 byte compact signature */
	std::string signature;
};

class cast_vote_reply final
{
public:
	politeia::error deserialize_json (boost::property_tree::ptree const & tree_a);
	void serialize_json (boost::property_tree::ptree & tree_a) const;
	std::string client_signature;
	/** Hex of the backend's ed25519 signature over client_signature, empty if the vote was rejected */
	std::string signature;
	std::string error;
};

/** Single line JSON without a trailing newline */
std::string to_json (boost::property_tree::ptree const & tree_a);
/** @return error_plugin::malformed_request if \p text_a is not JSON */
politeia::error from_json (std::string const & text_a, boost::property_tree::ptree & tree_a);

politeia::error decode_vote_request (std::string const & payload_a, politeia::vote_request & request_a);
std::string encode_vote_request (politeia::vote_request const & request_a);
std::string encode_start_vote_reply (politeia::start_vote_reply const & reply_a);
politeia::error decode_start_vote_reply (std::string const & payload_a, politeia::start_vote_reply & reply_a);
/** A cast votes payload is a JSON array of cast_vote objects */
politeia::error decode_cast_votes (std::string const & payload_a, std::vector<politeia::cast_vote> & votes_a);
std::string encode_cast_votes (std::vector<politeia::cast_vote> const & votes_a);
politeia::error decode_cast_vote_replies (std::string const & payload_a, std::vector<politeia::cast_vote_reply> & replies_a);
std::string encode_cast_vote_replies (std::vector<politeia::cast_vote_reply> const & replies_a);
}
