#pragma once

#include <politeia/lib/errors.hpp>

#include <boost/filesystem/path.hpp>

#include <fstream>
#include <string>
#include <unordered_set>

namespace politeia
{
class cast_vote;
class write_guard;

/**
 * Append-only log of the votes cast on one proposal, one JSON object per line in
 * <vetted>/<token>/votes. The file is closed when the ledger is destroyed.
 */
class vote_ledger final
{
public:
	vote_ledger (boost::filesystem::path const & vetted_path_a, std::string const & token_a);
	/**
	 * Opens the file for reading and appending, creating it if needed
	 * @return error_record::record_not_found if the token directory does not exist
	 */
	politeia::error open ();
	/**
	 * Rebuilds the set of tickets already voted from the file
	 * @return error_plugin::ledger_corrupt if a line does not decode, belongs to another token or repeats a ticket
	 */
	politeia::error replay ();
	bool contains (std::string const & ticket_a) const;
	size_t size () const;
	/**
	 * Writes \p vote_a as a single line at the end of the file and flushes it
	 * @param guard_a Proof the caller holds the write lock
	 * @return error_plugin::ledger_io if the write fails
	 */
	politeia::error append (politeia::write_guard const & guard_a, politeia::cast_vote const & vote_a);
	boost::filesystem::path const & path () const;

	static boost::filesystem::path ledger_path (boost::filesystem::path const & vetted_path_a, std::string const & token_a);

private:
	std::string token;
	boost::filesystem::path file_path;
	std::fstream file;
	std::unordered_set<std::string> tickets;
};
}
