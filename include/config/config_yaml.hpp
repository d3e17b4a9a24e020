#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace mds::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<CacheConfig> {
    static Node encode(const CacheConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        node["state_db"] = rhs.state_db.string();
        return node;
    }

    static bool decode(const Node& node, CacheConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>(mds::paths::getCacheRoot().string());
        rhs.state_db = node["state_db"].as<std::string>(mds::paths::getStateDbPath().string());
        return true;
    }
};

template<>
struct convert<FetchConfig> {
    static Node encode(const FetchConfig& rhs) {
        Node node;
        node["timeout_seconds"] = rhs.timeout_seconds;
        node["retry_on_timeout"] = rhs.retry_on_timeout;
        node["workers"] = rhs.workers;
        node["user_agent"] = rhs.user_agent;
        return node;
    }

    static bool decode(const Node& node, FetchConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(30);
        rhs.retry_on_timeout = node["retry_on_timeout"].as<bool>(true);
        rhs.workers = node["workers"].as<unsigned int>(4);
        rhs.user_agent = node["user_agent"].as<std::string>("mdsync/1.0");
        return true;
    }
};

template<>
struct convert<DiscoveryConfig> {
    static Node encode(const DiscoveryConfig& rhs) {
        Node node;
        node["manifest"] = rhs.manifest;
        node["format"] = to_string(rhs.format);
        node["extensions"] = rhs.extensions;
        return node;
    }

    static bool decode(const Node& node, DiscoveryConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.manifest = node["manifest"].as<std::string>("manifest.txt");
        rhs.format = parseFormat(node["format"].as<std::string>("plain"));
        if (node["extensions"]) rhs.extensions = node["extensions"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<HistoryConfig> {
    static Node encode(const HistoryConfig& rhs) {
        Node node;
        node["retention_days"] = rhs.retention_days.count();
        return node;
    }

    static bool decode(const Node& node, HistoryConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.retention_days = std::chrono::days(node["retention_days"].as<unsigned int>(30));
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["mdsync"]  = to_std_string(spdlog::level::to_string_view(rhs.mdsync));
        node["sources"] = to_std_string(spdlog::level::to_string_view(rhs.sources));
        node["fetch"]   = to_std_string(spdlog::level::to_string_view(rhs.fetch));
        node["store"]   = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["sync"]    = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["resolve"] = to_std_string(spdlog::level::to_string_view(rhs.resolve));
        node["db"]      = to_std_string(spdlog::level::to_string_view(rhs.db));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mdsync = spdlog::level::from_str(node["mdsync"].as<std::string>("info"));
        rhs.sources = spdlog::level::from_str(node["sources"].as<std::string>("info"));
        rhs.fetch = spdlog::level::from_str(node["fetch"].as<std::string>("info"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.resolve = spdlog::level::from_str(node["resolve"].as<std::string>("info"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (auto levels = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(levels, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(mds::paths::getLogPath().string());
        if (auto levels = node["log_levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

template<>
struct convert<SourceConfig> {
    static Node encode(const SourceConfig& rhs) {
        Node node;
        node["id"] = rhs.id;
        node["url"] = rhs.url;
        if (!rhs.subdirectory.empty()) node["subdirectory"] = rhs.subdirectory;
        node["priority"] = rhs.priority;
        node["enabled"] = rhs.enabled;
        return node;
    }

    static bool decode(const Node& node, SourceConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.id = node["id"].as<std::string>("");
        rhs.url = node["url"].as<std::string>("");
        rhs.subdirectory = node["subdirectory"].as<std::string>("");
        rhs.priority = node["priority"].as<int>(100);
        rhs.enabled = node["enabled"].as<bool>(true);
        return true;
    }
};

}
