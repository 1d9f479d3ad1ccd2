#include <politeia/lib/utility.hpp>

#include <boost/filesystem.hpp>

#include <iostream>
#include <sstream>

#ifndef _GNU_SOURCE
#define BEFORE_GNU_SOURCE 0
#define _GNU_SOURCE
#else
#define BEFORE_GNU_SOURCE 1
#endif
#include <boost/stacktrace.hpp>
#if !BEFORE_GNU_SOURCE
#undef _GNU_SOURCE
#endif

#include <sys/stat.h>
#include <sys/types.h>

void politeia::set_umask ()
{
	umask (077);
}

void politeia::set_secure_perm_directory (boost::filesystem::path const & path, boost::system::error_code & ec)
{
	boost::filesystem::permissions (path, boost::filesystem::owner_all, ec);
}

void politeia::set_secure_perm_file (boost::filesystem::path const & path)
{
	boost::filesystem::permissions (path, boost::filesystem::perms::owner_read | boost::filesystem::perms::owner_write);
}

void politeia::set_secure_perm_file (boost::filesystem::path const & path, boost::system::error_code & ec)
{
	boost::filesystem::permissions (path, boost::filesystem::perms::owner_read | boost::filesystem::perms::owner_write, ec);
}

std::string politeia::generate_stacktrace ()
{
	auto stacktrace = boost::stacktrace::stacktrace ();
	std::stringstream ss;
	ss << stacktrace;
	return ss.str ();
}

/*
 * Backing code for "release_assert" & "debug_assert", which are macros
 */
void assert_internal (const char * check_expr, const char * func, const char * file, unsigned int line, bool is_release_assert)
{
	std::cerr << "Assertion (" << check_expr << ") failed\n"
	          << func << "\n"
	          << file << ":" << line << "\n\n";

	// Output stack trace to cerr
	auto backtrace_str = politeia::generate_stacktrace ();
	std::cerr << backtrace_str << std::endl;

	abort ();
}
