#pragma once

#include <politeia/lib/errors.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree_fwd.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace politeia
{
class metadata_stream final
{
public:
	uint32_t id{ 0 };
	std::string payload;
};

/** Storage of proposal records, owned by the backend the plugin runs in */
class record_store
{
public:
	virtual ~record_store () = default;
	/** @return error_record::record_not_found or error_record::record_not_public if voting may not start */
	virtual politeia::error check_vote_allowed (std::string const & token_a) = 0;
	/** Payload of stream \p stream_id_a, empty if the record has no such stream */
	virtual politeia::error metadata (std::string const & token_a, uint32_t stream_id_a, boost::optional<std::string> & payload_a) = 0;
	/** Removes and then adds streams of a vetted record, all or nothing */
	virtual politeia::error update_vetted_metadata (std::string const & token_a, std::vector<uint32_t> const & removals_a, std::vector<politeia::metadata_stream> const & additions_a) = 0;
};

/**
 * Records stored as <vetted>/<token>/record.json, {"status": ..., "metadata": {"<id>": "<payload>"}}.
 * Each update replaces the file through a rename.
 */
class file_record_store final : public record_store
{
public:
	static std::string const status_public;

	explicit file_record_store (boost::filesystem::path const & vetted_path_a);
	politeia::error check_vote_allowed (std::string const & token_a) override;
	politeia::error metadata (std::string const & token_a, uint32_t stream_id_a, boost::optional<std::string> & payload_a) override;
	politeia::error update_vetted_metadata (std::string const & token_a, std::vector<uint32_t> const & removals_a, std::vector<politeia::metadata_stream> const & additions_a) override;
	/** Creates the record or changes the status of an existing one */
	politeia::error set_status (std::string const & token_a, std::string const & status_a);
	boost::filesystem::path record_path (std::string const & token_a) const;

private:
	politeia::error load (std::string const & token_a, boost::property_tree::ptree & record_a) const;
	politeia::error store (std::string const & token_a, boost::property_tree::ptree const & record_a) const;

	boost::filesystem::path vetted_path;
	std::mutex mutex;
};
}
