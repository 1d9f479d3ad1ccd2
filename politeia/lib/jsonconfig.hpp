#pragma once

#include <politeia/lib/configbase.hpp>
#include <politeia/lib/errors.hpp>
#include <politeia/lib/utility.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <type_traits>

namespace politeia
{
/** Manages a node in a boost configuration tree. */
class jsonconfig : public politeia::configbase
{
public:
	jsonconfig ();
	jsonconfig (boost::property_tree::ptree & tree_a, std::shared_ptr<politeia::error> error_a = nullptr);
	politeia::error & read (boost::filesystem::path const & path_a);
	void write (boost::filesystem::path const & path_a);
	void write (std::ostream & stream_a) const;
	void read (std::istream & stream_a);
	void open_or_create (std::fstream & stream_a, std::string const & path_a, std::ios_base::openmode mode_a = std::ios_base::in | std::ios_base::out);
	bool empty () const;
	boost::optional<jsonconfig> get_optional_child (std::string const & key_a);
	jsonconfig get_required_child (std::string const & key_a);
	jsonconfig & put_child (std::string const & key_a, politeia::jsonconfig & conf_a);
	bool has_key (std::string const & key_a);

	/**
	 * Reads a json configuration file and deserializes it into \p object. A missing or empty file
	 * is created from the defaults of \p object, a file upgraded by deserialize_json is written back.
	 */
	template <typename T>
	politeia::error read_and_update (T & object, boost::filesystem::path const & path_a)
	{
		auto error (read (path_a));
		if (!error)
		{
			if (empty ())
			{
				object.serialize_json (*this);
				write (path_a);
			}
			auto updated (false);
			error = object.deserialize_json (updated, *this);
			if (!error && updated)
			{
				write (path_a);
			}
			boost::system::error_code error_chmod;
			politeia::set_secure_perm_file (path_a, error_chmod);
		}
		return error;
	}

	/** Set value for the given key. Any existing value will be overwritten. */
	template <typename T>
	jsonconfig & put (std::string const & key, T const & value)
	{
		tree.put (key, value);
		return *this;
	}

	/**
	 * Get value of optional key. Use the default value if the key is not present. If the value is present, it's validated.
	 * @return The value, or default_value if missing
	 */
	template <typename T>
	jsonconfig & get_optional (std::string const & key, T & target, T default_value)
	{
		get_config (true, key, target, default_value);
		return *this;
	}

	/**
	 * Get value of optional key. Leave target untouched if the key is not present.
	 */
	template <typename T>
	jsonconfig & get_optional (std::string const & key, T & target)
	{
		get_config (true, key, target, target);
		return *this;
	}

	/** Get value of a required key. Sets error if the key is missing or the value cannot be converted. */
	template <typename T>
	jsonconfig & get_required (std::string const & key, T & target)
	{
		get_config (false, key, target);
		return *this;
	}

	/**
	 * Get value, using the current value of \p target as the default if \p key is missing.
	 * @return Value as T or an empty optional if the key is missing or an error occurred
	 */
	template <typename T>
	boost::optional<T> get_optional (std::string const & key)
	{
		boost::optional<T> res;
		if (has_key (key))
		{
			T target{};
			get_config (true, key, target, target);
			res = target;
		}
		return res;
	}

protected:
	template <typename T, typename = std::enable_if_t<!std::is_same<T, bool>::value>>
	jsonconfig & get_config (bool optional, std::string key, T & target, T default_value = T ())
	{
		try
		{
			auto val (tree.get<std::string> (key));
			// lexical_cast wraps negative numbers into unsigned targets
			auto negative (std::is_unsigned<T>::value && val.find ('-') != std::string::npos);
			if (negative || !boost::conversion::try_lexical_convert<T> (val, target))
			{
				conditionally_set_error<T> (politeia::error_config::invalid_value, key);
			}
		}
		catch (boost::property_tree::ptree_bad_path const &)
		{
			if (!optional)
			{
				conditionally_set_error<T> (politeia::error_config::missing_value, key);
			}
			else
			{
				target = default_value;
			}
		}
		catch (std::runtime_error & ex)
		{
			conditionally_set_error<T> (ex, key);
		}
		return *this;
	}

	jsonconfig & get_config (bool optional, std::string key, bool & target, bool default_value = false);

private:
	/** The property node being managed */
	boost::property_tree::ptree & tree;
	boost::property_tree::ptree tree_default;
};
}
