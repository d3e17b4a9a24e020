#pragma once

#include "config/paths.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace mds::config {

struct CacheConfig {
    std::filesystem::path root = paths::getCacheRoot();
    std::filesystem::path state_db = paths::getStateDbPath();
};

struct FetchConfig {
    unsigned int timeout_seconds = 30;
    bool retry_on_timeout = true;
    unsigned int workers = 4;
    std::string user_agent = "mdsync/1.0";
};

struct DiscoveryConfig {
    enum class Format { Plain, Json };

    std::string manifest = "manifest.txt";
    Format format = Format::Plain;
    std::vector<std::string> extensions = {".md"};
};

struct HistoryConfig {
    std::chrono::days retention_days{30};   // 0 keeps every run
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum mdsync = spdlog::level::info;
    spdlog::level::level_enum sources = spdlog::level::info;
    spdlog::level::level_enum fetch = spdlog::level::info;
    spdlog::level::level_enum store = spdlog::level::info;
    spdlog::level::level_enum sync = spdlog::level::info;
    spdlog::level::level_enum resolve = spdlog::level::info;
    spdlog::level::level_enum db = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = paths::getLogPath();
    LogLevelsConfig levels;
};

struct SourceConfig {
    std::string id;
    std::string url;
    std::string subdirectory;
    int priority = 100;
    bool enabled = true;
};

struct Config {
    CacheConfig cache;
    FetchConfig fetch;
    DiscoveryConfig discovery;
    HistoryConfig history;
    LoggingConfig logging;
    std::vector<SourceConfig> sources;
};

Config loadConfig(const std::filesystem::path& path);

std::string to_string(DiscoveryConfig::Format format);
DiscoveryConfig::Format parseFormat(const std::string& str);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const CacheConfig& c);
void to_json(nlohmann::json& j, const FetchConfig& c);
void to_json(nlohmann::json& j, const DiscoveryConfig& c);
void to_json(nlohmann::json& j, const HistoryConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const SourceConfig& c);

}
