#pragma once

#include <politeia/lib/errors.hpp>

#include <memory>
#include <string>

namespace politeia
{
/** Base type for configuration wrappers */
class configbase
{
public:
	configbase () = default;
	configbase (std::shared_ptr<politeia::error> const & error_a) :
	error (error_a)
	{
	}

	/** Returns the current error */
	politeia::error & get_error ()
	{
		return *error;
	}

protected:
	/** Set error if not already set, the first error is kept */
	template <typename T, typename V>
	void conditionally_set_error (V error_a, std::string const & key)
	{
		if (!*error)
		{
			*error = error_a;
			error->set_message ("Error processing configuration value \"" + key + "\": " + error->get_message ());
		}
	}

	/** We're a nested config and the error is shared with the parent */
	std::shared_ptr<politeia::error> error;
};
}
