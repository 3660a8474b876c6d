#include <ledgerstats/secure/utility.hpp>

#include <iostream>
#include <vector>

static std::vector<boost::filesystem::path> all_unique_paths;

boost::filesystem::path ledgerstats::unique_path ()
{
	auto result (boost::filesystem::temp_directory_path () / boost::filesystem::unique_path ("ledgerstats-%%%%-%%%%-%%%%-%%%%"));
	all_unique_paths.push_back (result);
	return result;
}

void ledgerstats::remove_temporary_directories ()
{
	for (auto & path : all_unique_paths)
	{
		boost::system::error_code ec;
		boost::filesystem::remove_all (path, ec);
		if (ec)
		{
			std::cerr << "Could not remove temporary directory: " << ec.message () << std::endl;
		}
	}
	all_unique_paths.clear ();
}
