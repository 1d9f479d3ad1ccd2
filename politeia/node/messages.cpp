#include <politeia/node/messages.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <cctype>
#include <sstream>
#include <unordered_set>

std::string const politeia::decred_plugin_constants::id = "decred";
std::string const politeia::decred_plugin_constants::version = "1";
std::string const politeia::decred_plugin_constants::cmd_start_vote = "startvote";
std::string const politeia::decred_plugin_constants::cmd_cast_votes = "castvotes";
std::string const politeia::decred_plugin_constants::cmd_best_block = "bestblock";
uint32_t const politeia::decred_plugin_constants::md_stream_vote_bits = 13;
uint32_t const politeia::decred_plugin_constants::md_stream_vote_snapshot = 14;

namespace
{
/** Accepts unsigned decimal integers only, lexical_cast alone would wrap "-1" */
bool parse_uint64 (std::string const & text_a, uint64_t & value_a)
{
	auto error (text_a.empty () || !std::isdigit (static_cast<unsigned char> (text_a[0])));
	if (!error)
	{
		error = !boost::conversion::try_lexical_convert (text_a, value_a);
	}
	return error;
}

politeia::error malformed (std::string const & what_a)
{
	return politeia::error ().set ("Malformed " + what_a, politeia::error_plugin::malformed_request);
}

/** Arrays are children with empty keys, an empty array reads back as an empty string */
bool is_array (boost::property_tree::ptree const & tree_a)
{
	return tree_a.empty () ? tree_a.data ().empty () : tree_a.count ("") == tree_a.size ();
}

bool is_object (boost::property_tree::ptree const & tree_a)
{
	return tree_a.data ().empty () && tree_a.count ("") == 0;
}

/** Strings are leaves, null and absent values read as empty */
bool get_string (boost::property_tree::ptree const & tree_a, std::string const & key_a, std::string & value_a)
{
	auto error (false);
	auto child (tree_a.get_child_optional (key_a));
	if (child)
	{
		error = !child->empty ();
		value_a = child->data () == "null" ? "" : child->data ();
	}
	return error;
}

template <typename T>
politeia::error decode_array (std::string const & payload_a, std::vector<T> & items_a, std::string const & what_a)
{
	boost::property_tree::ptree tree;
	auto result (politeia::from_json (payload_a, tree));
	// An empty object or string reads back like an empty array
	auto first (payload_a.find_first_not_of (" \t\r\n"));
	if (!result && (first == std::string::npos || payload_a[first] != '[' || !is_array (tree)))
	{
		result = malformed (what_a + ": expected an array");
	}
	std::vector<T> items;
	for (auto i (tree.begin ()), n (tree.end ()); !result && i != n; ++i)
	{
		T item;
		result = item.deserialize_json (i->second);
		items.push_back (std::move (item));
	}
	if (!result)
	{
		items_a = std::move (items);
	}
	return result;
}

/** The root of a property tree is always written as an object, arrays are joined here */
template <typename T>
std::string encode_array (std::vector<T> const & items_a)
{
	std::string result ("[");
	for (auto i (items_a.begin ()), n (items_a.end ()); i != n; ++i)
	{
		boost::property_tree::ptree tree;
		i->serialize_json (tree);
		if (i != items_a.begin ())
		{
			result.push_back (',');
		}
		result += politeia::to_json (tree);
	}
	result.push_back (']');
	return result;
}
}

std::string politeia::to_json (boost::property_tree::ptree const & tree_a)
{
	std::stringstream stream;
	boost::property_tree::write_json (stream, tree_a, false);
	auto result (stream.str ());
	while (!result.empty () && (result.back () == '\n' || result.back () == '\r'))
	{
		result.pop_back ();
	}
	return result;
}

politeia::error politeia::from_json (std::string const & text_a, boost::property_tree::ptree & tree_a)
{
	politeia::error result;
	std::stringstream stream (text_a);
	try
	{
		boost::property_tree::read_json (stream, tree_a);
	}
	catch (boost::property_tree::json_parser_error const & ex)
	{
		result.set ("Malformed JSON: " + ex.message (), politeia::error_plugin::malformed_request);
	}
	return result;
}

politeia::error politeia::vote_request::deserialize_json (boost::property_tree::ptree const & tree_a)
{
	politeia::error result;
	std::string mask_text;
	if (!is_object (tree_a) || get_string (tree_a, "token", token) || get_string (tree_a, "mask", mask_text) || parse_uint64 (mask_text, mask))
	{
		result = malformed ("vote");
	}
	auto options_l (tree_a.get_child_optional ("options"));
	if (!result && options_l)
	{
		if (!is_array (*options_l))
		{
			result = malformed ("vote options");
		}
		for (auto i (options_l->begin ()), n (options_l->end ()); !result && i != n; ++i)
		{
			politeia::vote_option option;
			std::string bits_text;
			if (!is_object (i->second) || get_string (i->second, "id", option.id) || get_string (i->second, "description", option.description) || get_string (i->second, "bits", bits_text) || parse_uint64 (bits_text, option.bits))
			{
				result = malformed ("vote option");
			}
			options.push_back (std::move (option));
		}
	}
	return result;
}

void politeia::vote_request::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("token", token);
	tree_a.put ("mask", mask);
	boost::property_tree::ptree options_l;
	for (auto const & option : options)
	{
		boost::property_tree::ptree entry;
		entry.put ("id", option.id);
		entry.put ("description", option.description);
		entry.put ("bits", option.bits);
		options_l.push_back (std::make_pair ("", entry));
	}
	tree_a.add_child ("options", options_l);
}

politeia::error politeia::vote_request::validate_bits () const
{
	politeia::error result;
	std::unordered_set<std::string> ids;
	if (mask == 0)
	{
		result.set ("Vote mask is zero", politeia::error_plugin::invalid_vote_bits);
	}
	else if (options.empty ())
	{
		result.set ("Vote has no options", politeia::error_plugin::invalid_vote_bits);
	}
	for (auto i (options.begin ()), n (options.end ()); !result && i != n; ++i)
	{
		if (i->id.empty () || !ids.insert (i->id).second)
		{
			result.set ("Vote option id is empty or repeated: " + i->id, politeia::error_plugin::invalid_vote_bits);
		}
		else if (i->bits == 0 || (i->bits & mask) != i->bits)
		{
			result.set ("Vote option " + i->id + " bits are not a non-zero subset of the mask", politeia::error_plugin::invalid_vote_bits);
		}
	}
	return result;
}

politeia::error politeia::start_vote_reply::deserialize_json (boost::property_tree::ptree const & tree_a)
{
	politeia::error result;
	std::string start_height_text;
	std::string end_height_text;
	if (!is_object (tree_a) || get_string (tree_a, "startblockheight", start_height_text) || parse_uint64 (start_height_text, start_block_height) || get_string (tree_a, "startblockhash", start_block_hash) || get_string (tree_a, "endheight", end_height_text) || parse_uint64 (end_height_text, end_height))
	{
		result = malformed ("start vote reply");
	}
	auto tickets (tree_a.get_child_optional ("eligibletickets"));
	if (!result && tickets)
	{
		if (!is_array (*tickets))
		{
			result = malformed ("eligible tickets");
		}
		for (auto i (tickets->begin ()), n (tickets->end ()); !result && i != n; ++i)
		{
			if (!i->second.empty ())
			{
				result = malformed ("eligible ticket");
			}
			eligible_tickets.push_back (i->second.data ());
		}
	}
	return result;
}

void politeia::start_vote_reply::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("startblockheight", std::to_string (start_block_height));
	tree_a.put ("startblockhash", start_block_hash);
	tree_a.put ("endheight", std::to_string (end_height));
	boost::property_tree::ptree tickets;
	for (auto const & ticket : eligible_tickets)
	{
		boost::property_tree::ptree entry;
		entry.put_value (ticket);
		tickets.push_back (std::make_pair ("", entry));
	}
	tree_a.add_child ("eligibletickets", tickets);
}

politeia::error politeia::cast_vote::deserialize_json (boost::property_tree::ptree const & tree_a)
{
	politeia::error result;
	if (!is_object (tree_a) || get_string (tree_a, "token", token) || get_string (tree_a, "ticket", ticket) || get_string (tree_a, "votebit", vote_bit) || get_string (tree_a, "signature", signature))
	{
		result = malformed ("cast vote");
	}
	return result;
}

void politeia::cast_vote::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("token", token);
	tree_a.put ("ticket", ticket);
	tree_a.put ("votebit", vote_bit);
	tree_a.put ("signature", signature);
}

std::string politeia::cast_vote::message () const
{
	return token + ticket + vote_bit;
}

politeia::error politeia::cast_vote_reply::deserialize_json (boost::property_tree::ptree const & tree_a)
{
	politeia::error result;
	if (!is_object (tree_a) || get_string (tree_a, "clientsignature", client_signature) || get_string (tree_a, "signature", signature) || get_string (tree_a, "error", error))
	{
		result = malformed ("cast vote reply");
	}
	return result;
}

void politeia::cast_vote_reply::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("clientsignature", client_signature);
	tree_a.put ("signature", signature);
	tree_a.put ("error", error);
}

politeia::error politeia::decode_vote_request (std::string const & payload_a, politeia::vote_request & request_a)
{
	boost::property_tree::ptree tree;
	auto result (from_json (payload_a, tree));
	politeia::vote_request request;
	if (!result)
	{
		result = request.deserialize_json (tree);
	}
	if (!result)
	{
		request_a = std::move (request);
	}
	return result;
}

std::string politeia::encode_vote_request (politeia::vote_request const & request_a)
{
	boost::property_tree::ptree tree;
	request_a.serialize_json (tree);
	return to_json (tree);
}

std::string politeia::encode_start_vote_reply (politeia::start_vote_reply const & reply_a)
{
	boost::property_tree::ptree tree;
	reply_a.serialize_json (tree);
	return to_json (tree);
}

politeia::error politeia::decode_start_vote_reply (std::string const & payload_a, politeia::start_vote_reply & reply_a)
{
	boost::property_tree::ptree tree;
	auto result (from_json (payload_a, tree));
	politeia::start_vote_reply reply;
	if (!result)
	{
		result = reply.deserialize_json (tree);
	}
	if (!result)
	{
		reply_a = std::move (reply);
	}
	return result;
}

politeia::error politeia::decode_cast_votes (std::string const & payload_a, std::vector<politeia::cast_vote> & votes_a)
{
	return decode_array (payload_a, votes_a, "cast votes");
}

std::string politeia::encode_cast_votes (std::vector<politeia::cast_vote> const & votes_a)
{
	return encode_array (votes_a);
}

politeia::error politeia::decode_cast_vote_replies (std::string const & payload_a, std::vector<politeia::cast_vote_reply> & replies_a)
{
	return decode_array (payload_a, replies_a, "cast vote replies");
}

std::string politeia::encode_cast_vote_replies (std::vector<politeia::cast_vote_reply> const & replies_a)
{
	return encode_array (replies_a);
}
