#include "gtest/gtest.h"

#include <politeia/node/logging.hpp>
#include <politeia/secure/utility.hpp>

#include <cstdio>
#include <cstdlib>

GTEST_API_ int main (int argc, char ** argv)
{
	printf ("Running main() from core_test_main.cc\n");
	// Setting up logging so that there aren't any piped to standard output.
	politeia::logging logging;
	logging.init (politeia::unique_path ());
	testing::InitGoogleTest (&argc, argv);
	auto res = RUN_ALL_TESTS ();
	politeia::logging::release_file_sink ();
	if (std::getenv ("TEST_KEEP_TMPDIRS") == nullptr)
	{
		politeia::remove_temporary_directories ();
	}
	return res;
}
