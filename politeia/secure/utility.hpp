#pragma once

#include <politeia/secure/network.hpp>

#include <boost/filesystem/path.hpp>

namespace politeia
{
/** Default data directory of the plugin for \p network_a */
boost::filesystem::path working_path (dcr_networks network_a = dcr_networks::mainnet);
/** Get a unique path within the simnet data directory, used for testing */
boost::filesystem::path unique_path ();
void remove_temporary_directories ();
}
