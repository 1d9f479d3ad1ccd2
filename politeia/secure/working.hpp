#pragma once

#include <boost/filesystem/path.hpp>

namespace politeia
{
boost::filesystem::path app_path ();
}
