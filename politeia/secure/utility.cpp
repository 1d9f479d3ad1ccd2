#include <politeia/secure/utility.hpp>
#include <politeia/secure/working.hpp>

#include <boost/filesystem.hpp>

#include <iostream>
#include <mutex>
#include <vector>

namespace
{
std::mutex all_unique_paths_mutex;
std::vector<boost::filesystem::path> all_unique_paths;
}

boost::filesystem::path politeia::working_path (dcr_networks network_a)
{
	auto result (politeia::app_path () / ".politeiad" / "data");
	result /= politeia::network_params (network_a).name;
	return result;
}

boost::filesystem::path politeia::unique_path ()
{
	auto result (working_path (dcr_networks::simnet) / boost::filesystem::unique_path ());
	std::lock_guard<std::mutex> lock (all_unique_paths_mutex);
	all_unique_paths.push_back (result);
	return result;
}

void politeia::remove_temporary_directories ()
{
	std::lock_guard<std::mutex> lock (all_unique_paths_mutex);
	for (auto & path : all_unique_paths)
	{
		boost::system::error_code ec;
		boost::filesystem::remove_all (path, ec);
		if (ec)
		{
			std::cerr << "Could not remove temporary directory: " << ec.message () << std::endl;
		}
	}
}
