#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace mds::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["cache"]) YAML::convert<CacheConfig>::decode(node, cfg.cache);
    if (auto node = root["fetch"]) YAML::convert<FetchConfig>::decode(node, cfg.fetch);
    if (auto node = root["discovery"]) YAML::convert<DiscoveryConfig>::decode(node, cfg.discovery);
    if (auto node = root["history"]) YAML::convert<HistoryConfig>::decode(node, cfg.history);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (auto node = root["sources"]; node && node.IsSequence()) {
        for (const auto& entry : node) {
            SourceConfig source;
            if (YAML::convert<SourceConfig>::decode(entry, source)) cfg.sources.push_back(std::move(source));
        }
    }

    return cfg;
}

std::string to_string(const DiscoveryConfig::Format format) {
    switch (format) {
        case DiscoveryConfig::Format::Plain: return "plain";
        case DiscoveryConfig::Format::Json: return "json";
    }
    return "plain";
}

DiscoveryConfig::Format parseFormat(const std::string& str) {
    if (str == "plain" || str == "text") return DiscoveryConfig::Format::Plain;
    if (str == "json") return DiscoveryConfig::Format::Json;
    throw std::invalid_argument("Unknown manifest format: " + str);
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"cache", c.cache},
        {"fetch", c.fetch},
        {"discovery", c.discovery},
        {"history", c.history},
        {"logging", c.logging},
        {"sources", c.sources}
    };
}

void to_json(nlohmann::json& j, const CacheConfig& c) {
    j = {
        {"root", c.root.string()},
        {"state_db", c.state_db.string()}
    };
}

void to_json(nlohmann::json& j, const FetchConfig& c) {
    j = {
        {"timeout_seconds", c.timeout_seconds},
        {"retry_on_timeout", c.retry_on_timeout},
        {"workers", c.workers},
        {"user_agent", c.user_agent}
    };
}

void to_json(nlohmann::json& j, const DiscoveryConfig& c) {
    j = {
        {"manifest", c.manifest},
        {"format", to_string(c.format)},
        {"extensions", c.extensions}
    };
}

void to_json(nlohmann::json& j, const HistoryConfig& c) {
    j = {{"retention_days", c.retention_days.count()}};
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"mdsync", levelName(c.mdsync)},
        {"sources", levelName(c.sources)},
        {"fetch", levelName(c.fetch)},
        {"store", levelName(c.store)},
        {"sync", levelName(c.sync)},
        {"resolve", levelName(c.resolve)},
        {"db", levelName(c.db)}
    };
}

void to_json(nlohmann::json& j, const SourceConfig& c) {
    j = {
        {"id", c.id},
        {"url", c.url},
        {"subdirectory", c.subdirectory},
        {"priority", c.priority},
        {"enabled", c.enabled}
    };
}

}
