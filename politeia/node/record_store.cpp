#include <politeia/lib/encoding.hpp>
#include <politeia/lib/utility.hpp>
#include <politeia/node/record_store.hpp>

#include <boost/filesystem/operations.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <fstream>

std::string const politeia::file_record_store::status_public = "public";

politeia::file_record_store::file_record_store (boost::filesystem::path const & vetted_path_a) :
vetted_path (vetted_path_a)
{
}

boost::filesystem::path politeia::file_record_store::record_path (std::string const & token_a) const
{
	return vetted_path / token_a / "record.json";
}

politeia::error politeia::file_record_store::load (std::string const & token_a, boost::property_tree::ptree & record_a) const
{
	politeia::error result;
	boost::system::error_code ec;
	// Tokens name directories, anything but hex could leave the store
	if (!politeia::is_hex (token_a) || !boost::filesystem::exists (record_path (token_a), ec))
	{
		result.set ("Record not found: " + token_a, politeia::error_record::record_not_found);
	}
	else
	{
		std::ifstream stream (record_path (token_a).string ());
		try
		{
			boost::property_tree::read_json (stream, record_a);
		}
		catch (boost::property_tree::json_parser_error const & ex)
		{
			result.set ("Unable to read record " + token_a + ": " + ex.message (), politeia::error_record::record_io);
		}
	}
	return result;
}

politeia::error politeia::file_record_store::store (std::string const & token_a, boost::property_tree::ptree const & record_a) const
{
	politeia::error result;
	auto path (record_path (token_a));
	auto temporary (path);
	temporary += ".tmp";
	boost::system::error_code ec;
	boost::filesystem::create_directories (path.parent_path (), ec);
	if (!ec)
	{
		std::ofstream stream (temporary.string (), std::ios_base::out | std::ios_base::trunc);
		try
		{
			boost::property_tree::write_json (stream, record_a);
		}
		catch (boost::property_tree::json_parser_error const & ex)
		{
			result.set (ex.message (), politeia::error_record::record_io);
		}
		stream.close ();
		if (!result && !stream)
		{
			result.set ("Write failed", politeia::error_record::record_io);
		}
	}
	if (!result && !ec)
	{
		politeia::set_secure_perm_file (temporary, ec);
	}
	if (!result && !ec)
	{
		boost::filesystem::rename (temporary, path, ec);
	}
	if (!result && ec)
	{
		result.set (ec.message (), politeia::error_record::record_io);
	}
	if (result)
	{
		boost::system::error_code ignored;
		boost::filesystem::remove (temporary, ignored);
		result.set_message ("Unable to store record " + token_a + ": " + result.get_message ());
	}
	return result;
}

politeia::error politeia::file_record_store::check_vote_allowed (std::string const & token_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	boost::property_tree::ptree record;
	auto result (load (token_a, record));
	if (!result)
	{
		auto status (record.get<std::string> ("status", ""));
		if (status != status_public)
		{
			result.set ("Record " + token_a + " is not public: " + status, politeia::error_record::record_not_public);
		}
	}
	return result;
}

politeia::error politeia::file_record_store::metadata (std::string const & token_a, uint32_t stream_id_a, boost::optional<std::string> & payload_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	boost::property_tree::ptree record;
	auto result (load (token_a, record));
	if (!result)
	{
		payload_a = record.get_optional<std::string> ("metadata." + std::to_string (stream_id_a));
	}
	return result;
}

politeia::error politeia::file_record_store::update_vetted_metadata (std::string const & token_a, std::vector<uint32_t> const & removals_a, std::vector<politeia::metadata_stream> const & additions_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	boost::property_tree::ptree record;
	auto result (load (token_a, record));
	if (!result)
	{
		if (record.find ("metadata") == record.not_found ())
		{
			record.add_child ("metadata", boost::property_tree::ptree ());
		}
		auto & metadata_l (record.get_child ("metadata"));
		for (auto id : removals_a)
		{
			metadata_l.erase (std::to_string (id));
		}
		for (auto const & stream : additions_a)
		{
			metadata_l.put (std::to_string (stream.id), stream.payload);
		}
		result = store (token_a, record);
	}
	return result;
}

politeia::error politeia::file_record_store::set_status (std::string const & token_a, std::string const & status_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	politeia::error result;
	boost::property_tree::ptree record;
	if (!politeia::is_hex (token_a))
	{
		result.set ("Invalid record token: " + token_a, politeia::error_record::record_not_found);
	}
	else
	{
		boost::system::error_code ec;
		if (boost::filesystem::exists (record_path (token_a), ec))
		{
			result = load (token_a, record);
		}
	}
	if (!result)
	{
		record.put ("status", status_a);
		result = store (token_a, record);
	}
	return result;
}
