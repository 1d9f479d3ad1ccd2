#pragma once

#include <boost/current_function.hpp>
#include <boost/system/error_code.hpp>

#include <string>

namespace boost
{
namespace filesystem
{
	class path;
}
}

void assert_internal (const char * check_expr, const char * func, const char * file, unsigned int line, bool is_release_assert);

#define release_assert(check) check ? (void)0 : assert_internal (#check, BOOST_CURRENT_FUNCTION, __FILE__, __LINE__, true)

#ifdef NDEBUG
#define debug_assert(check) (void)0
#else
#define debug_assert(check) check ? (void)0 : assert_internal (#check, BOOST_CURRENT_FUNCTION, __FILE__, __LINE__, false)
#endif

namespace politeia
{
/*
 * Functions for managing filesystem permissions, platform specific
 */
void set_umask ();
void set_secure_perm_directory (boost::filesystem::path const & path, boost::system::error_code & ec);
void set_secure_perm_file (boost::filesystem::path const & path);
void set_secure_perm_file (boost::filesystem::path const & path, boost::system::error_code & ec);

/** Stack trace of the calling thread, used by failed assertions */
std::string generate_stacktrace ();
}
