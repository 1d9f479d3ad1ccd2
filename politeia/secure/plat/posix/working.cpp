#include <politeia/lib/utility.hpp>
#include <politeia/secure/working.hpp>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace politeia
{
boost::filesystem::path app_path ()
{
	auto entry (getpwuid (getuid ()));
	debug_assert (entry != nullptr);
	boost::filesystem::path result (entry->pw_dir);
	return result;
}
}
