#include "services/SyncService.hpp"
#include "sources/Registry.hpp"
#include "store/ContentHashStore.hpp"
#include "sync/CacheLayout.hpp"
#include "types/errors.hpp"
#include "util/files.hpp"
#include "FakeHttpClient.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace mds;
using mds::services::SyncService;
using mds::store::model::SyncRun;
namespace fs = std::filesystem;

class SyncServiceTest : public ::testing::Test {
protected:
    static constexpr auto MAIN = "https://example.test/repo";
    static constexpr auto FORK = "https://example.test/fork";

    fs::path tempDir;
    config::Config cfg;
    std::shared_ptr<test::FakeHttpClient> http;

    void SetUp() override {
        tempDir = test::makeTempDir("mdsync_service_test");
        cfg = test::makeTestConfig(tempDir);
        cfg.sources = {
            {"docs-main", MAIN, "", 0, true},
            {"research-fork", FORK, "", 10, true},
        };
        http = std::make_shared<test::FakeHttpClient>();

        publish(MAIN, "manifest.txt", "research.md\nintro.md\n");
        publish(MAIN, "research.md", "# Research (main)\n");
        publish(MAIN, "intro.md", "# Intro\n");
        publish(FORK, "manifest.txt", "agents/research.md\nwriter.md\n");
        publish(FORK, "agents/research.md", "# Research (fork)\n");
        publish(FORK, "writer.md", "# Writer\n");
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    void publish(const std::string& base, const std::string& path, const std::string& content) const {
        http->put(base + "/" + path, content);
    }
};

TEST_F(SyncServiceTest, SeedsConfiguredSources) {
    const SyncService service(cfg, http);
    const auto sources = service.registry()->list();
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0]->id, "docs-main");
    EXPECT_EQ(sources[1]->id, "research-fork");
}

TEST_F(SyncServiceTest, SyncThenResolvePrefersHigherPrioritySource) {
    SyncService service(cfg, http);

    const auto report = service.sync();
    EXPECT_TRUE(report.allSucceeded());
    EXPECT_EQ(report.totalFetched(), 4u);

    const auto merged = service.resolve();
    ASSERT_EQ(merged.artifacts.size(), 3u);

    const auto* research = merged.find("research");
    ASSERT_NE(research, nullptr);
    EXPECT_EQ(research->source_id, "docs-main");
    EXPECT_EQ(util::readFileToString(research->local_cache_path), "# Research (main)\n");

    ASSERT_NE(merged.find("writer"), nullptr);
    EXPECT_EQ(merged.find("writer")->source_id, "research-fork");

    const auto conflicts = merged.conflictsFor("research");
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].shadowed_source_id, "research-fork");
    EXPECT_EQ(conflicts[0].shadowed_path, "agents/research.md");
}

TEST_F(SyncServiceTest, StateSurvivesRestart) {
    {
        SyncService service(cfg, http);
        (void)service.sync();
    }

    http->resetCounters();
    SyncService restarted(cfg, http);
    const auto report = restarted.sync();
    EXPECT_EQ(report.totalFetched(), 0u);
    EXPECT_EQ(report.totalUnchanged(), 4u);
    EXPECT_EQ(http->totalServed(), 0u);
}

TEST_F(SyncServiceTest, DisabledSourceDropsOutOfResolution) {
    SyncService service(cfg, http);
    (void)service.sync();

    sources::model::SourceUpdate update;
    update.enabled = false;
    service.registry()->update("docs-main", update);

    const auto merged = service.resolve();
    ASSERT_NE(merged.find("research"), nullptr);
    EXPECT_EQ(merged.find("research")->source_id, "research-fork");
    EXPECT_EQ(merged.find("intro"), nullptr);
}

TEST_F(SyncServiceTest, RemoveSourceDropsStateAndCache) {
    SyncService service(cfg, http);
    (void)service.sync();

    const auto fork = service.registry()->get("research-fork");
    ASSERT_NE(fork, nullptr);
    const auto cacheDir = service.layout()->sourceDir(*fork);
    ASSERT_TRUE(fs::exists(cacheDir));

    service.removeSource("research-fork");

    EXPECT_EQ(service.registry()->get("research-fork"), nullptr);
    EXPECT_TRUE(service.store()->listArtifacts("research-fork").empty());
    EXPECT_TRUE(service.store()->getRecentRuns("research-fork").empty());
    EXPECT_FALSE(fs::exists(cacheDir));
    EXPECT_EQ(service.resolve().find("writer"), nullptr);

    EXPECT_THROW(service.removeSource("research-fork"), types::NotFoundError);
}

TEST_F(SyncServiceTest, SourcesGetDistinctCacheDirectories) {
    const SyncService service(cfg, http);
    const auto main = service.registry()->get("docs-main");
    const auto fork = service.registry()->get("research-fork");

    EXPECT_NE(sync::CacheLayout::slug(*main), sync::CacheLayout::slug(*fork));
    EXPECT_EQ(sync::CacheLayout::slug(*main).size(), sync::CacheLayout::SLUG_LENGTH);
    EXPECT_THROW((void)service.layout()->artifactPath(*main, "../escape.md"), std::invalid_argument);
}
