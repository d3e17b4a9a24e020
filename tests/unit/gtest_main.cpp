#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        mds::paths::setLogPathForTesting(fs::temp_directory_path() / "mdsync_test_logs");
        mds::config::ConfigRegistry::initDefaults();
        mds::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize mdsync test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
