#pragma once

#include <boost/filesystem.hpp>

namespace ledgerstats
{
// Get a unique path within the temporary directory, used by tests for scratch files
boost::filesystem::path unique_path ();
// Remove all unique tmp directories created by the process
void remove_temporary_directories ();
}
