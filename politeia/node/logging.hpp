#pragma once

#include <politeia/lib/errors.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/log/sinks.hpp>
#include <boost/shared_ptr.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>

namespace politeia
{
class jsonconfig;

class logging final
{
public:
	politeia::error serialize_json (politeia::jsonconfig &) const;
	politeia::error deserialize_json (politeia::jsonconfig &);
	/** Accept, reject and duplicate decisions for every cast vote */
	bool vote_logging () const;
	/** Every request sent to the block explorer */
	bool oracle_logging () const;
	bool log_to_cerr () const;
	/** Adds the file sink under \p application_path_a/log, only the first call has an effect */
	void init (boost::filesystem::path const & application_path_a);

	bool vote_logging_value{ false };
	bool oracle_logging_value{ false };
	bool log_to_cerr_value{ false };
	bool flush{ true };
	uintmax_t max_size{ 128 * 1024 * 1024 };
	uintmax_t rotation_size{ 4 * 1024 * 1024 };
	std::chrono::milliseconds min_time_between_log_output{ 5 };
	static void release_file_sink ();

private:
	static std::atomic_flag logging_already_added;
	static boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>> file_sink;
};
}
