#include "config/Config.hpp"
#include "config/paths.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace mds::config;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path tempDir;

    void SetUp() override {
        tempDir = mds::test::makeTempDir("mdsync_config_test");
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    static void writeTextFile(const fs::path& p, const std::string& content) {
        std::ofstream out(p, std::ios::binary);
        out << content;
    }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = loadConfig(tempDir / "nope.yaml");

    EXPECT_EQ(cfg.fetch.timeout_seconds, 30u);
    EXPECT_TRUE(cfg.fetch.retry_on_timeout);
    EXPECT_EQ(cfg.fetch.workers, 4u);
    EXPECT_EQ(cfg.discovery.manifest, "manifest.txt");
    EXPECT_EQ(cfg.discovery.format, DiscoveryConfig::Format::Plain);
    ASSERT_EQ(cfg.discovery.extensions.size(), 1u);
    EXPECT_EQ(cfg.discovery.extensions.front(), ".md");
    EXPECT_EQ(cfg.history.retention_days.count(), 30);
    EXPECT_TRUE(cfg.sources.empty());
}

TEST_F(ConfigTest, LoadsEverySection) {
    const auto path = tempDir / "config.yaml";
    writeTextFile(path, R"(
cache:
  root: /tmp/mdsync-cache
  state_db: /tmp/mdsync-state.db
fetch:
  timeout_seconds: 10
  retry_on_timeout: false
  workers: 2
  user_agent: agent-sync/2
discovery:
  manifest: index.json
  format: json
  extensions: [".md", ".markdown"]
history:
  retention_days: 7
logging:
  log_dir: /tmp/mdsync-logs
  log_levels:
    console_log_level: warn
    subsystem_levels:
      fetch: debug
sources:
  - id: docs-main
    url: https://example.test/repo
    subdirectory: agents
    priority: 0
  - id: research-fork
    url: https://example.test/fork
    priority: 10
    enabled: false
  - just a string
)");

    const auto cfg = loadConfig(path);

    EXPECT_EQ(cfg.cache.root.string(), "/tmp/mdsync-cache");
    EXPECT_EQ(cfg.cache.state_db.string(), "/tmp/mdsync-state.db");
    EXPECT_EQ(cfg.fetch.timeout_seconds, 10u);
    EXPECT_FALSE(cfg.fetch.retry_on_timeout);
    EXPECT_EQ(cfg.fetch.workers, 2u);
    EXPECT_EQ(cfg.fetch.user_agent, "agent-sync/2");
    EXPECT_EQ(cfg.discovery.manifest, "index.json");
    EXPECT_EQ(cfg.discovery.format, DiscoveryConfig::Format::Json);
    EXPECT_EQ(cfg.discovery.extensions.size(), 2u);
    EXPECT_EQ(cfg.history.retention_days.count(), 7);
    EXPECT_EQ(cfg.logging.log_dir.string(), "/tmp/mdsync-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.fetch, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.db, spdlog::level::warn);

    // Non-map entries are skipped
    ASSERT_EQ(cfg.sources.size(), 2u);
    EXPECT_EQ(cfg.sources[0].id, "docs-main");
    EXPECT_EQ(cfg.sources[0].subdirectory, "agents");
    EXPECT_EQ(cfg.sources[0].priority, 0);
    EXPECT_TRUE(cfg.sources[0].enabled);
    EXPECT_EQ(cfg.sources[1].priority, 10);
    EXPECT_FALSE(cfg.sources[1].enabled);
}

TEST_F(ConfigTest, PartialSectionsFallBackToDefaultPaths) {
    const auto path = tempDir / "config.yaml";
    writeTextFile(path, R"(
cache:
  state_db: /tmp/mdsync-state.db
logging:
  log_levels:
    console_log_level: error
)");

    const auto cfg = loadConfig(path);

    EXPECT_EQ(cfg.cache.root.string(), mds::paths::getCacheRoot().string());
    EXPECT_EQ(cfg.cache.state_db.string(), "/tmp/mdsync-state.db");
    EXPECT_EQ(cfg.logging.log_dir.string(), mds::paths::getLogPath().string());
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::err);
}

TEST_F(ConfigTest, UnknownManifestFormatThrows) {
    EXPECT_EQ(parseFormat("text"), DiscoveryConfig::Format::Plain);
    EXPECT_THROW((void)parseFormat("xml"), std::invalid_argument);

    const auto path = tempDir / "config.yaml";
    writeTextFile(path, "discovery:\n  format: xml\n");
    EXPECT_THROW((void)loadConfig(path), std::exception);
}

TEST_F(ConfigTest, SerializesToJson) {
    Config cfg = mds::test::makeTestConfig(tempDir);
    cfg.sources.push_back({"docs-main", "https://example.test/repo", "", 0, true});

    const nlohmann::json j = cfg;
    EXPECT_EQ(j["fetch"]["timeout_seconds"], 5);
    EXPECT_EQ(j["discovery"]["format"], "plain");
    EXPECT_EQ(j["history"]["retention_days"], 30);
    ASSERT_EQ(j["sources"].size(), 1u);
    EXPECT_EQ(j["sources"][0]["id"], "docs-main");
}
