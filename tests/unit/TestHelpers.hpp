#pragma once

#include "config/Config.hpp"
#include "util/files.hpp"

#include <filesystem>
#include <string>

namespace mds::test {

inline std::filesystem::path makeTempDir(const std::string& prefix) {
    auto dir = std::filesystem::temp_directory_path() / (prefix + "_" + util::generate_random_suffix(10));
    std::filesystem::create_directories(dir);
    return dir;
}

inline config::Config makeTestConfig(const std::filesystem::path& root) {
    config::Config cfg;
    cfg.cache.root = root / "cache";
    cfg.cache.state_db = root / "state.db";
    cfg.fetch.timeout_seconds = 5;
    cfg.fetch.workers = 4;
    return cfg;
}

}
