#include <politeia/lib/jsonconfig.hpp>
#include <politeia/node/logging.hpp>

#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <iostream>

boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>> politeia::logging::file_sink;
std::atomic_flag politeia::logging::logging_already_added ATOMIC_FLAG_INIT;

void politeia::logging::init (boost::filesystem::path const & application_path_a)
{
	if (!logging_already_added.test_and_set ())
	{
		boost::log::add_common_attributes ();
		if (log_to_cerr ())
		{
			boost::log::add_console_log (std::cerr, boost::log::keywords::format = "[%TimeStamp%]: %Message%");
		}

		auto path = application_path_a / "log";
		file_sink = boost::log::add_file_log (boost::log::keywords::target = path, boost::log::keywords::file_name = path / "log_%Y-%m-%d_%H-%M-%S.%N.log", boost::log::keywords::rotation_size = rotation_size, boost::log::keywords::auto_flush = flush, boost::log::keywords::scan_method = boost::log::sinks::file::scan_method::scan_matching, boost::log::keywords::max_size = max_size, boost::log::keywords::format = "[%TimeStamp%]: %Message%");
	}
}

void politeia::logging::release_file_sink ()
{
	if (logging_already_added.test_and_set ())
	{
		boost::log::core::get ()->remove_sink (politeia::logging::file_sink);
		politeia::logging::file_sink.reset ();
	}
}

politeia::error politeia::logging::serialize_json (politeia::jsonconfig & json) const
{
	json.put ("vote", vote_logging_value);
	json.put ("oracle", oracle_logging_value);
	json.put ("log_to_cerr", log_to_cerr_value);
	json.put ("flush", flush);
	json.put ("max_size", max_size);
	json.put ("rotation_size", rotation_size);
	json.put ("min_time_between_output", min_time_between_log_output.count ());
	return json.get_error ();
}

politeia::error politeia::logging::deserialize_json (politeia::jsonconfig & json)
{
	json.get_optional<bool> ("vote", vote_logging_value);
	json.get_optional<bool> ("oracle", oracle_logging_value);
	json.get_optional<bool> ("log_to_cerr", log_to_cerr_value);
	json.get_optional<bool> ("flush", flush);
	json.get_optional<uintmax_t> ("max_size", max_size);
	json.get_optional<uintmax_t> ("rotation_size", rotation_size);
	auto min_time_between_log_output_l (min_time_between_log_output.count ());
	json.get_optional<decltype (min_time_between_log_output_l)> ("min_time_between_output", min_time_between_log_output_l);
	min_time_between_log_output = std::chrono::milliseconds (min_time_between_log_output_l);
	return json.get_error ();
}

bool politeia::logging::vote_logging () const
{
	return vote_logging_value;
}

bool politeia::logging::oracle_logging () const
{
	return oracle_logging_value;
}

bool politeia::logging::log_to_cerr () const
{
	return log_to_cerr_value;
}
