#include <gtest/gtest.h>

#include "fedfs/mount/globals.hh"
#include "fedfs/util/logging.hh"

using namespace fedfs;

int main(int argc, char ** argv)
{
    // Keep test output readable; tests that look at log messages
    // capture them instead.
    verbosity = lvlWarn;

    // Tests must not depend on the settings of whoever runs them.
    mountSettings.mountConfigFile = "";
    mountSettings.randomHandleSeed = false;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
