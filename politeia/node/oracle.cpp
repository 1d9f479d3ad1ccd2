#include <politeia/lib/logger_mt.hpp>
#include <politeia/node/oracle.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <openssl/err.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>

namespace
{
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;
using ssl_stream = beast::ssl_stream<beast::tcp_stream>;

void handshake (beast::tcp_stream &, std::string const &, std::function<void(boost::system::error_code const &)> callback_a)
{
	callback_a (boost::system::error_code{});
}

void handshake (ssl_stream & stream_a, std::string const & host_a, std::function<void(boost::system::error_code const &)> callback_a)
{
	// Servers behind a shared address need SNI to pick the certificate
	if (!SSL_set_tlsext_host_name (stream_a.native_handle (), host_a.c_str ()))
	{
		callback_a (boost::system::error_code (static_cast<int> (::ERR_get_error ()), boost::asio::error::get_ssl_category ()));
	}
	else
	{
		stream_a.set_verify_callback (boost::asio::ssl::host_name_verification (host_a));
		stream_a.async_handshake (boost::asio::ssl::stream_base::client, callback_a);
	}
}

/** A single GET request driven by the io_context passed at construction */
template <typename Stream>
class http_get final : public std::enable_shared_from_this<http_get<Stream>>
{
public:
	template <typename... StreamArgs>
	http_get (boost::asio::io_context & io_ctx_a, politeia::service_url const & url_a, std::string const & target_a, std::chrono::milliseconds timeout_a, StreamArgs &&... stream_args_a) :
	resolver (io_ctx_a),
	stream (std::forward<StreamArgs> (stream_args_a)...),
	url (url_a),
	timeout (timeout_a)
	{
		request.method (http::verb::get);
		request.target (target_a);
		request.version (11);
		request.set (http::field::host, url.host);
		request.set (http::field::accept, "application/json");
	}

	void run ()
	{
		auto this_l (this->shared_from_this ());
		resolver.async_resolve (url.host, url.port, [this_l](boost::system::error_code const & ec_a, tcp::resolver::results_type results_a) {
			if (!ec_a)
			{
				beast::get_lowest_layer (this_l->stream).expires_after (this_l->timeout);
				beast::get_lowest_layer (this_l->stream).async_connect (results_a, [this_l](boost::system::error_code const & ec_a, tcp::endpoint const &) {
					if (!ec_a)
					{
						handshake (this_l->stream, this_l->url.host, [this_l](boost::system::error_code const & ec_a) {
							if (!ec_a)
							{
								this_l->write ();
							}
							else
							{
								this_l->ec = ec_a;
							}
						});
					}
					else
					{
						this_l->ec = ec_a;
					}
				});
			}
			else
			{
				this_l->ec = ec_a;
			}
		});
	}

	boost::system::error_code ec;
	http::response<http::string_body> response;

private:
	void write ()
	{
		auto this_l (this->shared_from_this ());
		beast::get_lowest_layer (stream).expires_after (timeout);
		http::async_write (stream, request, [this_l](boost::system::error_code const & ec_a, size_t) {
			if (!ec_a)
			{
				beast::get_lowest_layer (this_l->stream).expires_after (this_l->timeout);
				http::async_read (this_l->stream, this_l->buffer, this_l->response, [this_l](boost::system::error_code const & ec_a, size_t) {
					this_l->ec = ec_a;
					beast::error_code ignored;
					beast::get_lowest_layer (this_l->stream).socket ().shutdown (tcp::socket::shutdown_both, ignored);
				});
			}
			else
			{
				this_l->ec = ec_a;
			}
		});
	}

	tcp::resolver resolver;
	Stream stream;
	politeia::service_url const & url;
	std::chrono::milliseconds timeout;
	beast::flat_buffer buffer;
	http::request<http::empty_body> request;
};

template <typename Stream, typename... StreamArgs>
boost::system::error_code perform (boost::asio::io_context & io_ctx_a, politeia::service_url const & url_a, std::string const & target_a, std::chrono::milliseconds timeout_a, http::response<http::string_body> & response_a, StreamArgs &&... stream_args_a)
{
	boost::system::error_code result;
	auto request (std::make_shared<http_get<Stream>> (io_ctx_a, url_a, target_a, timeout_a, std::forward<StreamArgs> (stream_args_a)...));
	request->run ();
	io_ctx_a.run_for (timeout_a);
	if (!io_ctx_a.stopped ())
	{
		// Name resolution is not covered by the stream expiry
		io_ctx_a.stop ();
		result = boost::asio::error::timed_out;
	}
	else if (request->ec)
	{
		result = request->ec;
	}
	else
	{
		response_a = std::move (request->response);
	}
	return result;
}

bool parse_json (std::string const & body_a, boost::property_tree::ptree & tree_a)
{
	auto error (false);
	std::stringstream stream (body_a);
	try
	{
		boost::property_tree::read_json (stream, tree_a);
	}
	catch (boost::property_tree::ptree_error const &)
	{
		error = true;
	}
	return error;
}

politeia::error decode_error (std::string const & what_a)
{
	return politeia::error ().set ("Unable to decode " + what_a + " from dcrdata", politeia::error_plugin::oracle_unavailable);
}
}

politeia::error politeia::dcrdata::parse_block (std::string const & body_a, politeia::block_info & block_a)
{
	politeia::error result;
	boost::property_tree::ptree tree;
	if (!parse_json (body_a, tree))
	{
		auto height (tree.get_optional<uint64_t> ("height"));
		auto hash (tree.get_optional<std::string> ("hash"));
		if (height && hash && !hash->empty ())
		{
			block_a.height = *height;
			block_a.hash = *hash;
		}
		else
		{
			result = decode_error ("block");
		}
	}
	else
	{
		result = decode_error ("block");
	}
	return result;
}

politeia::error politeia::dcrdata::parse_ticket_pool (std::string const & body_a, std::vector<std::string> & tickets_a)
{
	politeia::error result;
	boost::property_tree::ptree tree;
	auto error (parse_json (body_a, tree));
	// An empty pool may be reported as null
	error = error || (tree.empty () && !tree.data ().empty () && tree.data () != "null");
	std::vector<std::string> tickets;
	for (auto i (tree.begin ()), n (tree.end ()); !error && i != n; ++i)
	{
		error = !i->first.empty () || !i->second.empty () || i->second.data ().empty ();
		tickets.push_back (i->second.data ());
	}
	if (!error)
	{
		tickets_a = std::move (tickets);
	}
	else
	{
		result = decode_error ("ticket pool");
	}
	return result;
}

politeia::error politeia::dcrdata::parse_largest_commitment_address (std::string const & body_a, std::string & address_a)
{
	politeia::error result;
	boost::property_tree::ptree tree;
	if (!parse_json (body_a, tree))
	{
		std::string best_address;
		double best_amount (0.0);
		auto outputs (tree.get_child_optional ("vout"));
		if (outputs)
		{
			for (auto const & output : *outputs)
			{
				auto amount (output.second.get_optional<double> ("scriptPubKey.commitamt"));
				if (amount && *amount > best_amount)
				{
					auto addresses (output.second.get_child_optional ("scriptPubKey.addresses"));
					if (addresses && !addresses->empty ())
					{
						best_address = addresses->front ().second.data ();
						best_amount = *amount;
					}
				}
			}
		}
		if (!best_address.empty () && best_amount != 0.0)
		{
			address_a = best_address;
		}
		else
		{
			result.set ("No best commitment address found: " + tree.get<std::string> ("txid", ""), politeia::error_plugin::oracle_unavailable);
		}
	}
	else
	{
		result = decode_error ("transaction");
	}
	return result;
}

bool politeia::dcrdata::valid_argument (std::string const & argument_a)
{
	return !argument_a.empty () && std::all_of (argument_a.begin (), argument_a.end (), [](char ch) { return std::isalnum (static_cast<unsigned char> (ch)) != 0; });
}

bool politeia::service_url::parse (std::string const & url_a)
{
	std::string remainder;
	auto error (false);
	if (url_a.compare (0, 8, "https://") == 0)
	{
		secure = true;
		port = "443";
		remainder = url_a.substr (8);
	}
	else if (url_a.compare (0, 7, "http://") == 0)
	{
		secure = false;
		port = "80";
		remainder = url_a.substr (7);
	}
	else
	{
		error = true;
	}
	if (!error)
	{
		auto slash (remainder.find ('/'));
		auto authority (remainder.substr (0, slash));
		path = slash == std::string::npos ? "/" : remainder.substr (slash);
		if (path.back () != '/')
		{
			path.push_back ('/');
		}
		auto colon (authority.rfind (':'));
		if (colon != std::string::npos)
		{
			port = authority.substr (colon + 1);
			authority.erase (colon);
			error = port.empty () || !std::all_of (port.begin (), port.end (), [](char ch) { return std::isdigit (static_cast<unsigned char> (ch)) != 0; });
		}
		host = authority;
		error = error || host.empty ();
	}
	return error;
}

std::string politeia::service_url::to_string () const
{
	return (secure ? "https://" : "http://") + host + ":" + port + path;
}

politeia::dcrdata_oracle::dcrdata_oracle (politeia::service_url const & url_a, std::chrono::milliseconds timeout_a, politeia::logger_mt & logger_a, bool log_requests_a) :
url (url_a),
timeout (timeout_a),
logger (logger_a),
log_requests (log_requests_a)
{
}

politeia::error politeia::dcrdata_oracle::get (std::string const & resource_a, std::string & body_a)
{
	politeia::error result;
	if (log_requests)
	{
		logger.always_log ("Connecting to ", url.to_string (), resource_a);
	}
	boost::system::error_code ec;
	http::response<http::string_body> response;
	try
	{
		if (url.secure)
		{
			boost::asio::ssl::context ssl_ctx (boost::asio::ssl::context::tlsv12_client);
			ssl_ctx.set_default_verify_paths ();
			ssl_ctx.set_verify_mode (boost::asio::ssl::verify_peer);
			boost::asio::io_context io_ctx;
			ec = perform<ssl_stream> (io_ctx, url, url.path + resource_a, timeout, response, io_ctx, ssl_ctx);
		}
		else
		{
			boost::asio::io_context io_ctx;
			ec = perform<beast::tcp_stream> (io_ctx, url, url.path + resource_a, timeout, response, io_ctx);
		}
		if (ec)
		{
			result.set (boost::str (boost::format ("Request to %1%%2% failed: %3%") % url.to_string () % resource_a % ec.message ()), politeia::error_plugin::oracle_unavailable);
		}
		else if (response.result () != http::status::ok)
		{
			result.set (boost::str (boost::format ("Request to %1%%2% returned status %3%") % url.to_string () % resource_a % response.result_int ()), politeia::error_plugin::oracle_unavailable);
		}
		else
		{
			body_a = std::move (response.body ());
		}
	}
	catch (std::exception const & ex)
	{
		result.set (boost::str (boost::format ("Request to %1%%2% failed: %3%") % url.to_string () % resource_a % ex.what ()), politeia::error_plugin::oracle_unavailable);
	}
	return result;
}

politeia::error politeia::dcrdata_oracle::best_block (politeia::block_info & block_a)
{
	std::string body;
	auto result (get ("api/block/best", body));
	if (!result)
	{
		result = dcrdata::parse_block (body, block_a);
	}
	return result;
}

politeia::error politeia::dcrdata_oracle::block (uint64_t height_a, politeia::block_info & block_a)
{
	std::string body;
	auto result (get ("api/block/" + std::to_string (height_a), body));
	if (!result)
	{
		result = dcrdata::parse_block (body, block_a);
	}
	return result;
}

politeia::error politeia::dcrdata_oracle::ticket_pool (std::string const & block_hash_a, std::vector<std::string> & tickets_a)
{
	politeia::error result;
	if (dcrdata::valid_argument (block_hash_a))
	{
		std::string body;
		result = get ("api/stake/pool/b/" + block_hash_a + "/full?sort=true", body);
		if (!result)
		{
			result = dcrdata::parse_ticket_pool (body, tickets_a);
		}
	}
	else
	{
		result.set ("Invalid block hash: " + block_hash_a, politeia::error_plugin::malformed_request);
	}
	return result;
}

politeia::error politeia::dcrdata_oracle::largest_commitment_address (std::string const & ticket_a, std::string & address_a)
{
	politeia::error result;
	if (dcrdata::valid_argument (ticket_a))
	{
		std::string body;
		result = get ("api/tx/" + ticket_a, body);
		if (!result)
		{
			result = dcrdata::parse_largest_commitment_address (body, address_a);
		}
	}
	else
	{
		result.set ("Invalid ticket: " + ticket_a, politeia::error_plugin::malformed_request);
	}
	return result;
}
