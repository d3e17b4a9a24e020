#include "config/paths.hpp"

#include <cstdlib>
#include <mutex>

namespace fs = std::filesystem;

namespace {
    std::mutex overrideMutex;
    fs::path logPathOverride;

    fs::path fromEnv(const char* name) {
        const char* value = std::getenv(name);
        if (!value || !*value) return {};
        return {value};
    }
}

namespace mds::paths {

fs::path getHomePath() {
    if (auto home = fromEnv("MDSYNC_HOME"); !home.empty()) return home;
    if (auto home = fromEnv("HOME"); !home.empty()) return home / ".mdsync";
    return fs::temp_directory_path() / ".mdsync";
}

fs::path getConfigPath() {
    if (auto cfg = fromEnv("MDSYNC_CONFIG"); !cfg.empty()) return cfg;
    return getHomePath() / "config.yaml";
}

fs::path getCacheRoot() { return getHomePath() / "cache"; }

fs::path getStateDbPath() { return getHomePath() / "state.db"; }

fs::path getLogPath() {
    {
        std::scoped_lock lock(overrideMutex);
        if (!logPathOverride.empty()) return logPathOverride;
    }
    return getHomePath() / "logs";
}

void setLogPathForTesting(const fs::path& path) {
    std::scoped_lock lock(overrideMutex);
    logPathOverride = path;
}

}
