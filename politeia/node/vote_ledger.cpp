#include <politeia/lib/utility.hpp>
#include <politeia/node/messages.hpp>
#include <politeia/node/vote_ledger.hpp>
#include <politeia/node/write_lock.hpp>

#include <boost/filesystem/operations.hpp>
#include <boost/format.hpp>
#include <boost/property_tree/ptree.hpp>

politeia::vote_ledger::vote_ledger (boost::filesystem::path const & vetted_path_a, std::string const & token_a) :
token (token_a),
file_path (ledger_path (vetted_path_a, token_a))
{
}

boost::filesystem::path politeia::vote_ledger::ledger_path (boost::filesystem::path const & vetted_path_a, std::string const & token_a)
{
	return vetted_path_a / token_a / "votes";
}

boost::filesystem::path const & politeia::vote_ledger::path () const
{
	return file_path;
}

politeia::error politeia::vote_ledger::open ()
{
	politeia::error result;
	boost::system::error_code ec;
	// The record store owns the token directory, ledgers are only created beside existing records
	if (!boost::filesystem::exists (file_path.parent_path (), ec))
	{
		result.set ("Record not found: " + token, politeia::error_record::record_not_found);
	}
	else
	{
		file.open (file_path.string (), std::ios_base::in | std::ios_base::out | std::ios_base::app);
		if (!file.is_open ())
		{
			result.set ("Unable to open vote ledger " + file_path.string (), politeia::error_plugin::ledger_io);
		}
	}
	return result;
}

politeia::error politeia::vote_ledger::replay ()
{
	politeia::error result;
	tickets.clear ();
	file.clear ();
	file.seekg (0, std::ios_base::beg);
	std::string line;
	size_t line_number (0);
	while (!result && std::getline (file, line))
	{
		++line_number;
		boost::property_tree::ptree tree;
		politeia::cast_vote vote;
		auto decoded (politeia::from_json (line, tree));
		if (!decoded)
		{
			decoded = vote.deserialize_json (tree);
		}
		if (decoded)
		{
			result.set (boost::str (boost::format ("Vote ledger %1% line %2% does not decode: %3%") % file_path.string () % line_number % decoded.get_message ()), politeia::error_plugin::ledger_corrupt);
		}
		else if (vote.token != token)
		{
			result.set (boost::str (boost::format ("Vote ledger %1% line %2% is for token %3%") % file_path.string () % line_number % vote.token), politeia::error_plugin::ledger_corrupt);
		}
		else if (!tickets.insert (vote.ticket).second)
		{
			result.set (boost::str (boost::format ("Vote ledger %1% line %2% repeats ticket %3%") % file_path.string () % line_number % vote.ticket), politeia::error_plugin::ledger_corrupt);
		}
	}
	if (!result && file.bad ())
	{
		result.set ("Unable to read vote ledger " + file_path.string (), politeia::error_plugin::ledger_io);
	}
	file.clear ();
	return result;
}

bool politeia::vote_ledger::contains (std::string const & ticket_a) const
{
	return tickets.find (ticket_a) != tickets.end ();
}

size_t politeia::vote_ledger::size () const
{
	return tickets.size ();
}

politeia::error politeia::vote_ledger::append (politeia::write_guard const & guard_a, politeia::cast_vote const & vote_a)
{
	debug_assert (guard_a.is_owned ());
	debug_assert (vote_a.token == token);
	politeia::error result;
	boost::property_tree::ptree tree;
	vote_a.serialize_json (tree);
	file << politeia::to_json (tree) << '\n';
	file.flush ();
	if (!file)
	{
		file.clear ();
		result.set ("Unable to append to vote ledger " + file_path.string (), politeia::error_plugin::ledger_io);
	}
	else
	{
		tickets.insert (vote_a.ticket);
	}
	return result;
}
