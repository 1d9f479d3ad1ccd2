#include <politeia/lib/errors.hpp>
#include <politeia/lib/utility.hpp>

#include <boost/system/error_code.hpp>

std::string politeia::error_common_messages::message (int ev) const
{
	switch (static_cast<politeia::error_common> (ev))
	{
		case politeia::error_common::generic:
			return "Unknown error";
		case politeia::error_common::exception:
			return "Exception thrown";
		case politeia::error_common::invalid_type_conversion:
			return "Invalid type conversion";
	}

	return "Invalid error code";
}

std::string politeia::error_plugin_messages::message (int ev) const
{
	switch (static_cast<politeia::error_plugin> (ev))
	{
		case politeia::error_plugin::generic:
			return "Unknown error";
		case politeia::error_plugin::malformed_request:
			return "Malformed request payload";
		case politeia::error_plugin::malformed_token:
			return "Malformed proposal token";
		case politeia::error_plugin::invalid_vote_bits:
			return "Invalid vote bits";
		case politeia::error_plugin::invalid_address:
			return "Invalid address";
		case politeia::error_plugin::invalid_signature:
			return "Invalid signature";
		case politeia::error_plugin::oracle_unavailable:
			return "Blockchain data source unavailable";
		case politeia::error_plugin::chain_too_young:
			return "Best block height is below ticket maturity";
		case politeia::error_plugin::vote_already_started:
			return "Vote already started for proposal";
		case politeia::error_plugin::backend_busy:
			return "Backend busy, try again later";
		case politeia::error_plugin::shutdown_in_progress:
			return "Backend is shutting down";
		case politeia::error_plugin::ledger_corrupt:
			return "Vote ledger is corrupt";
		case politeia::error_plugin::ledger_io:
			return "Vote ledger I/O error";
		case politeia::error_plugin::identity_missing:
			return "Signing identity not available";
		case politeia::error_plugin::unknown_command:
			return "Unknown plugin command";
		case politeia::error_plugin::unknown_plugin:
			return "Unknown plugin";
	}

	return "Invalid error code";
}

std::string politeia::error_record_messages::message (int ev) const
{
	switch (static_cast<politeia::error_record> (ev))
	{
		case politeia::error_record::generic:
			return "Unknown error";
		case politeia::error_record::record_not_found:
			return "Record not found";
		case politeia::error_record::record_not_public:
			return "Record is not public";
		case politeia::error_record::record_io:
			return "Record store I/O error";
	}

	return "Invalid error code";
}

std::string politeia::error_config_messages::message (int ev) const
{
	switch (static_cast<politeia::error_config> (ev))
	{
		case politeia::error_config::generic:
			return "Unknown error";
		case politeia::error_config::invalid_value:
			return "Invalid configuration value";
		case politeia::error_config::missing_value:
			return "Missing value in configuration";
	}

	return "Invalid error code";
}

const char * politeia::error_conversion::detail::generic_category::name () const noexcept
{
	return boost::system::generic_category ().name ();
}

std::string politeia::error_conversion::detail::generic_category::message (int value) const
{
	return boost::system::generic_category ().message (value);
}

const std::error_category & politeia::error_conversion::generic_category ()
{
	static detail::generic_category instance;
	return instance;
}

std::error_code politeia::error_conversion::convert (const boost::system::error_code & error)
{
	if (error.category () == boost::system::generic_category ())
	{
		return std::error_code (error.value (),
		politeia::error_conversion::generic_category ());
	}

	return politeia::error_common::invalid_type_conversion;
}

politeia::error::error (std::error_code code_a)
{
	code = code_a;
}

politeia::error::error (boost::system::error_code const & code_a)
{
	code = std::make_error_code (static_cast<std::errc> (code_a.value ()));
}

politeia::error::error (std::string message_a)
{
	code = politeia::error_common::generic;
	message = std::move (message_a);
}

politeia::error::error (std::exception const & exception_a)
{
	code = politeia::error_common::exception;
	message = exception_a.what ();
}

politeia::error & politeia::error::operator= (politeia::error const & err_a)
{
	code = err_a.code;
	message = err_a.message;
	return *this;
}

politeia::error & politeia::error::operator= (politeia::error && err_a)
{
	code = err_a.code;
	message = std::move (err_a.message);
	return *this;
}

/** Assign error code */
politeia::error & politeia::error::operator= (const std::error_code code_a)
{
	code = code_a;
	message.clear ();
	return *this;
}

/** Assign boost error code (as converted to std::error_code) */
politeia::error & politeia::error::operator= (const boost::system::error_code & code_a)
{
	code = politeia::error_conversion::convert (code_a);
	message.clear ();
	return *this;
}

/** Set the error to politeia::error_common::generic and the error message to \p message_a */
politeia::error & politeia::error::operator= (const std::string message_a)
{
	code = politeia::error_common::generic;
	message = std::move (message_a);
	return *this;
}

/** Sets the error to politeia::error_common::exception and adopts the exception error message. */
politeia::error & politeia::error::operator= (std::exception const & exception_a)
{
	code = politeia::error_common::exception;
	message = exception_a.what ();
	return *this;
}

std::error_code const & politeia::error::get_code () const
{
	return code;
}

/** Implicit bool conversion; true if there's an error */
politeia::error::operator bool () const
{
	return code.value () != 0;
}

/**
 * Get error message, or an empty string if there's no error. If a custom error message is set,
 * that will be returned, otherwise the error_code#message() is returned.
 */
std::string politeia::error::get_message () const
{
	std::string res = message;
	if (code && res.empty ())
	{
		res = code.message ();
	}
	return res;
}

/** Set an error message and an error code */
politeia::error & politeia::error::set (std::string message_a, std::error_code code_a)
{
	message = message_a;
	code = code_a;
	return *this;
}

/** Set a custom error message. If the error code is not set, it will be set to politeia::error_common::generic. */
politeia::error & politeia::error::set_message (std::string message_a)
{
	if (!code)
	{
		code = politeia::error_common::generic;
	}
	message = std::move (message_a);
	return *this;
}
