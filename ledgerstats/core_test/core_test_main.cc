#include "gtest/gtest.h"

#include <cstdio>

namespace ledgerstats
{
void cleanup_test_directories_on_exit ();
}
GTEST_API_ int main (int argc, char ** argv)
{
	printf ("Running main() from core_test_main.cc\n");
	testing::InitGoogleTest (&argc, argv);
	auto res = RUN_ALL_TESTS ();
	ledgerstats::cleanup_test_directories_on_exit ();
	return res;
}
