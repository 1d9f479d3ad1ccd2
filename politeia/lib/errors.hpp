#pragma once

#include <boost/system/error_code.hpp>

#include <string>
#include <system_error>
#include <type_traits>

namespace politeia
{
/** Common error codes */
enum class error_common
{
	generic = 1,
	exception,
	invalid_type_conversion
};

/** Errors returned by the voting plugin and its dispatcher */
enum class error_plugin
{
	generic = 1,
	malformed_request,
	malformed_token,
	invalid_vote_bits,
	invalid_address,
	invalid_signature,
	oracle_unavailable,
	chain_too_young,
	vote_already_started,
	backend_busy,
	shutdown_in_progress,
	ledger_corrupt,
	ledger_io,
	identity_missing,
	unknown_command,
	unknown_plugin
};

/** Errors reported by the record store collaborator */
enum class error_record
{
	generic = 1,
	record_not_found,
	record_not_public,
	record_io
};

/** Configuration errors */
enum class error_config
{
	generic = 1,
	invalid_value,
	missing_value
};
}

// Convenience macro to implement the standard boilerplate for using std::error_code with enums
// Use this at the end of any header defining one or more error code enums.
#define REGISTER_ERROR_CODES(namespace_name, enum_type)                                                      \
	namespace namespace_name                                                                                 \
	{                                                                                                        \
		static_assert (static_cast<int> (enum_type::generic) > 0, "The first error enum must be generic = 1"); \
		class enum_type##_messages : public std::error_category                                              \
		{                                                                                                    \
		public:                                                                                              \
			const char * name () const noexcept override                                                     \
			{                                                                                                \
				return #enum_type;                                                                           \
			}                                                                                                \
                                                                                                             \
			std::string message (int ev) const override;                                                     \
		};                                                                                                   \
                                                                                                             \
		inline const std::error_category & enum_type##_category ()                                           \
		{                                                                                                    \
			static enum_type##_messages instance;                                                            \
			return instance;                                                                                 \
		}                                                                                                    \
                                                                                                             \
		inline std::error_code make_error_code (::namespace_name::enum_type err)                             \
		{                                                                                                    \
			return std::error_code (static_cast<int> (err), enum_type##_category ());                        \
		}                                                                                                    \
	}                                                                                                        \
	namespace std                                                                                            \
	{                                                                                                        \
		template <>                                                                                          \
		struct is_error_code_enum<::namespace_name::enum_type> : public std::true_type                       \
		{                                                                                                    \
		};                                                                                                   \
	}

REGISTER_ERROR_CODES (politeia, error_common);
REGISTER_ERROR_CODES (politeia, error_plugin);
REGISTER_ERROR_CODES (politeia, error_record);
REGISTER_ERROR_CODES (politeia, error_config);

/* boost->std error_code bridge */
namespace politeia
{
namespace error_conversion
{
	namespace detail
	{
		class generic_category : public std::error_category
		{
		public:
			const char * name () const noexcept override;
			std::string message (int value) const override;
		};
	}
	const std::error_category & generic_category ();
	std::error_code convert (const boost::system::error_code & error);
}
}

namespace politeia
{
/** Adapter for std/boost::error_code, std::exception and bool flags to facilitate unified error handling */
class error
{
public:
	error () = default;
	error (politeia::error const & error_a) = default;
	error (politeia::error && error_a) = default;

	error (std::error_code code_a);
	error (boost::system::error_code const & code_a);
	error (std::string message_a);
	error (std::exception const & exception_a);
	error & operator= (politeia::error const & err_a);
	error & operator= (politeia::error && err_a);
	error & operator= (const std::error_code code_a);
	error & operator= (const boost::system::error_code & code_a);
	error & operator= (const std::string message_a);
	error & operator= (std::exception const & exception_a);
	explicit operator bool () const;
	std::string get_message () const;
	std::error_code const & get_code () const;
	error & set (std::string message_a, std::error_code code_a = politeia::error_common::generic);
	error & set_message (std::string message_a);

private:
	std::error_code code;
	std::string message;
};
}
