#include <politeia/lib/jsonconfig.hpp>
#include <politeia/lib/utility.hpp>

#include <boost/filesystem/convenience.hpp>
#include <boost/property_tree/json_parser.hpp>

politeia::jsonconfig::jsonconfig () :
tree (tree_default)
{
	error = std::make_shared<politeia::error> ();
}

politeia::jsonconfig::jsonconfig (boost::property_tree::ptree & tree_a, std::shared_ptr<politeia::error> error_a) :
politeia::configbase (error_a), tree (tree_a)
{
	if (!error)
	{
		error = std::make_shared<politeia::error> ();
	}
}

/**
 * Reads a json object from the stream
 * @return politeia::error&, including a descriptive error message if the config file is malformed.
 */
politeia::error & politeia::jsonconfig::read (boost::filesystem::path const & path_a)
{
	std::fstream stream;
	open_or_create (stream, path_a.string ());
	if (!stream.fail ())
	{
		try
		{
			boost::property_tree::read_json (stream, tree);
		}
		catch (std::runtime_error const & ex)
		{
			auto pos (stream.tellg ());
			if (pos != std::streampos (0))
			{
				*error = ex;
			}
		}
		stream.close ();
	}
	return *error;
}

void politeia::jsonconfig::write (boost::filesystem::path const & path_a)
{
	std::fstream stream;
	open_or_create (stream, path_a.string (), std::ios_base::out | std::ios_base::trunc);
	write (stream);
}

void politeia::jsonconfig::write (std::ostream & stream_a) const
{
	boost::property_tree::write_json (stream_a, tree);
}

void politeia::jsonconfig::read (std::istream & stream_a)
{
	boost::property_tree::read_json (stream_a, tree);
}

/** Open configuration file, create if necessary */
void politeia::jsonconfig::open_or_create (std::fstream & stream_a, std::string const & path_a, std::ios_base::openmode mode_a)
{
	if (!boost::filesystem::exists (path_a))
	{
		// Create temp stream to first create the file
		std::ofstream stream (path_a);

		// Set permissions before opening otherwise Windows only has read permissions
		politeia::set_secure_perm_file (path_a);
	}

	stream_a.open (path_a, mode_a);
}

bool politeia::jsonconfig::empty () const
{
	return tree.empty ();
}

boost::optional<politeia::jsonconfig> politeia::jsonconfig::get_optional_child (std::string const & key_a)
{
	boost::optional<jsonconfig> child_config;
	auto child = tree.get_child_optional (key_a);
	if (child)
	{
		return jsonconfig (child.get (), error);
	}
	return child_config;
}

politeia::jsonconfig politeia::jsonconfig::get_required_child (std::string const & key_a)
{
	auto child = tree.get_child_optional (key_a);
	if (!child)
	{
		*error = politeia::error_config::missing_value;
		error->set_message ("Missing configuration node: " + key_a);
	}
	return child ? jsonconfig (child.get (), error) : *this;
}

politeia::jsonconfig & politeia::jsonconfig::put_child (std::string const & key_a, politeia::jsonconfig & conf_a)
{
	tree.add_child (key_a, conf_a.tree);
	return *this;
}

/** Returns true if \p key_a is present */
bool politeia::jsonconfig::has_key (std::string const & key_a)
{
	return tree.find (key_a) != tree.not_found ();
}

politeia::jsonconfig & politeia::jsonconfig::get_config (bool optional, std::string key, bool & target, bool default_value)
{
	auto bool_conv = [this, &target, &key](std::string val) {
		if (val == "true")
		{
			target = true;
		}
		else if (val == "false")
		{
			target = false;
		}
		else if (!*error)
		{
			conditionally_set_error<bool> (politeia::error_config::invalid_value, key);
		}
	};
	try
	{
		auto val (tree.get<std::string> (key));
		bool_conv (val);
	}
	catch (boost::property_tree::ptree_bad_path const &)
	{
		if (!optional)
		{
			conditionally_set_error<bool> (politeia::error_config::missing_value, key);
		}
		else
		{
			target = default_value;
		}
	}
	catch (std::runtime_error & ex)
	{
		conditionally_set_error<bool> (ex, key);
	}
	return *this;
}
