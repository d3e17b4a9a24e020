#pragma once

#include <filesystem>

namespace mds::paths {

// Root of all mdsync state: $MDSYNC_HOME, else $HOME/.mdsync
std::filesystem::path getHomePath();

std::filesystem::path getConfigPath();
std::filesystem::path getCacheRoot();
std::filesystem::path getStateDbPath();
std::filesystem::path getLogPath();

void setLogPathForTesting(const std::filesystem::path& path);

}
