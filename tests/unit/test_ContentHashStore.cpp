#include "crypto/util/hash.hpp"
#include "database/DBConnection.hpp"
#include "database/Database.hpp"
#include "sources/Registry.hpp"
#include "store/ContentHashStore.hpp"
#include "types/errors.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace mds;
using namespace mds::store;
using namespace mds::store::model;
namespace fs = std::filesystem;

class ContentHashStoreTest : public ::testing::Test {
protected:
    fs::path tempDir;
    fs::path dbPath;
    std::shared_ptr<database::Database> db;
    std::shared_ptr<ContentHashStore> store;

    void SetUp() override {
        tempDir = test::makeTempDir("mdsync_store_test");
        dbPath = tempDir / "state.db";
        db = std::make_shared<database::Database>(dbPath);
        store = std::make_shared<ContentHashStore>(db);
        store->open();

        sources::Registry registry(db);
        registry.registerSource(sources::model::Source("docs-main", "https://example.test/repo", 0));
    }

    void TearDown() override {
        store->close();
        store.reset();
        db.reset();
        fs::remove_all(tempDir);
    }

    // Writes content into the cache dir and tracks it
    fs::path track(const std::string& path, const std::string& content) {
        const auto local = tempDir / "cache" / path;
        util::writeFileAtomic(local, content);
        store->recordFile("docs-main", path, crypto::hash::sha256Hex(content), local, content.size(), std::string("\"e1\""));
        return local;
    }

    static SyncRun makeRun(const std::time_t startedAt, const SyncRun::Status status = SyncRun::Status::SUCCESS) {
        SyncRun run;
        run.source_id = "docs-main";
        run.started_at = startedAt;
        run.status = status;
        return run;
    }
};

TEST_F(ContentHashStoreTest, HasChangedOnlyFalseForExactMatch) {
    const auto hash = crypto::hash::sha256Hex("content");

    EXPECT_TRUE(store->hasChanged("docs-main", "intro.md", hash));

    track("intro.md", "content");
    EXPECT_FALSE(store->hasChanged("docs-main", "intro.md", hash));
    EXPECT_TRUE(store->hasChanged("docs-main", "intro.md", crypto::hash::sha256Hex("other")));
    EXPECT_TRUE(store->hasChanged("other-source", "intro.md", hash));
}

TEST_F(ContentHashStoreTest, RecordFileUpserts) {
    track("intro.md", "one");
    track("intro.md", "two");

    const auto artifact = store->getArtifact("docs-main", "intro.md");
    ASSERT_NE(artifact, nullptr);
    EXPECT_EQ(artifact->content_hash, crypto::hash::sha256Hex("two"));
    EXPECT_EQ(artifact->size_bytes, 3u);
    EXPECT_EQ(artifact->etag.value_or(""), "\"e1\"");
    EXPECT_GT(artifact->synced_at, 0);
    EXPECT_EQ(store->listArtifacts("docs-main").size(), 1u);
    EXPECT_EQ(store->getHash("docs-main", "intro.md"), crypto::hash::sha256Hex("two"));
    EXPECT_FALSE(store->getHash("docs-main", "missing.md").has_value());
}

TEST_F(ContentHashStoreTest, ListArtifactsSortedByPath) {
    track("setup.md", "s");
    track("agents/research.md", "r");
    track("intro.md", "i");

    const auto all = store->listArtifacts("docs-main");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0]->path, "agents/research.md");
    EXPECT_EQ(all[1]->path, "intro.md");
    EXPECT_EQ(all[2]->path, "setup.md");
}

TEST_F(ContentHashStoreTest, VerifyLocalDetectsTampering) {
    EXPECT_EQ(store->verifyLocal("docs-main", "intro.md"), Integrity::Untracked);

    const auto local = track("intro.md", "original");
    EXPECT_EQ(store->verifyLocal("docs-main", "intro.md"), Integrity::Ok);

    {
        std::ofstream out(local, std::ios::binary | std::ios::trunc);
        out << "edited by hand";
    }
    EXPECT_EQ(store->verifyLocal("docs-main", "intro.md"), Integrity::Diverged);

    fs::remove(local);
    EXPECT_EQ(store->verifyLocal("docs-main", "intro.md"), Integrity::Missing);
    EXPECT_EQ(to_string(Integrity::Missing), "missing");
}

TEST_F(ContentHashStoreTest, RecentRunsNewestFirstAndLimited) {
    const auto now = util::nowSeconds();
    for (int i = 0; i < 5; ++i) {
        auto run = makeRun(now + i);
        run.files_fetched = static_cast<uint32_t>(i);
        (void)store->recordSyncRun(run);
    }

    const auto runs = store->getRecentRuns("docs-main", 3);
    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(runs[0].files_fetched, 4u);
    EXPECT_EQ(runs[1].files_fetched, 3u);
    EXPECT_EQ(runs[2].files_fetched, 2u);
    EXPECT_GT(runs[0].id, runs[1].id);
}

TEST_F(ContentHashStoreTest, SyncRunFieldsRoundTrip) {
    auto run = makeRun(1700000000, SyncRun::Status::PARTIAL);
    run.files_fetched = 2;
    run.files_unchanged = 1;
    run.files_failed = 1;
    run.error_detail = "b.md: HTTP 500";
    run.duration_ms = 1234;

    const auto id = store->recordSyncRun(run);
    EXPECT_GT(id, 0);

    const auto runs = store->getRecentRuns("docs-main");
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].id, id);
    EXPECT_EQ(runs[0].started_at, 1700000000);
    EXPECT_EQ(runs[0].status, SyncRun::Status::PARTIAL);
    EXPECT_EQ(runs[0].files_failed, 1u);
    EXPECT_EQ(runs[0].error_detail, "b.md: HTTP 500");
    EXPECT_EQ(runs[0].duration_ms, 1234u);

    const nlohmann::json j = runs[0];
    EXPECT_EQ(j["status"], "partial");
}

TEST_F(ContentHashStoreTest, DeriveStatus) {
    EXPECT_EQ(SyncRun::deriveStatus(0, 0, 0), SyncRun::Status::SUCCESS);
    EXPECT_EQ(SyncRun::deriveStatus(2, 1, 0), SyncRun::Status::SUCCESS);
    EXPECT_EQ(SyncRun::deriveStatus(1, 0, 1), SyncRun::Status::PARTIAL);
    EXPECT_EQ(SyncRun::deriveStatus(0, 1, 1), SyncRun::Status::PARTIAL);
    EXPECT_EQ(SyncRun::deriveStatus(0, 0, 3), SyncRun::Status::ERROR);

    SyncRun::Status parsed{};
    EXPECT_TRUE(SyncRun::tryParseStatus("error", parsed));
    EXPECT_EQ(parsed, SyncRun::Status::ERROR);
    EXPECT_FALSE(SyncRun::tryParseStatus("bogus", parsed));
}

TEST_F(ContentHashStoreTest, SyncRunsAreAppendOnly) {
    (void)store->recordSyncRun(makeRun(util::nowSeconds()));
    store->close();

    const database::DBConnection conn(dbPath);
    EXPECT_THROW(conn.execRaw("UPDATE sync_runs SET status = 'error';"), types::StoreError);
}

TEST_F(ContentHashStoreTest, PurgeSourceClearsArtifactsAndRuns) {
    track("intro.md", "i");
    (void)store->recordSyncRun(makeRun(util::nowSeconds()));

    store->purgeSource("docs-main");

    EXPECT_TRUE(store->listArtifacts("docs-main").empty());
    EXPECT_TRUE(store->getRecentRuns("docs-main").empty());
}

TEST_F(ContentHashStoreTest, PruneRemovesRunsOutsideRetention) {
    const auto now = util::nowSeconds();
    (void)store->recordSyncRun(makeRun(now - 40 * 86400));
    (void)store->recordSyncRun(makeRun(now - 31 * 86400));
    (void)store->recordSyncRun(makeRun(now - 86400));

    EXPECT_EQ(store->pruneRunsOlderThan(std::chrono::days(0)), 0u);
    EXPECT_EQ(store->getRecentRuns("docs-main").size(), 3u);

    EXPECT_EQ(store->pruneRunsOlderThan(std::chrono::days(30)), 2u);
    EXPECT_EQ(store->getRecentRuns("docs-main").size(), 1u);
}

TEST_F(ContentHashStoreTest, StatePersistsAcrossReopen) {
    track("intro.md", "persisted");
    store->close();

    auto db2 = std::make_shared<database::Database>(dbPath);
    ContentHashStore reopened(db2);
    reopened.open();
    EXPECT_EQ(reopened.getHash("docs-main", "intro.md"), crypto::hash::sha256Hex("persisted"));
    reopened.close();
}

TEST_F(ContentHashStoreTest, CorruptStateFileIsRecreatedEmpty) {
    store->close();
    for (const auto* suffix : {"", "-wal", "-shm"}) fs::remove(fs::path(dbPath.string() + suffix));
    {
        std::ofstream out(dbPath, std::ios::binary | std::ios::trunc);
        out << std::string(8192, 'Z');
    }

    auto db2 = std::make_shared<database::Database>(dbPath);
    ContentHashStore reopened(db2);
    ASSERT_NO_THROW(reopened.open());
    EXPECT_TRUE(reopened.listArtifacts("docs-main").empty());
    EXPECT_TRUE(sources::Registry(db2).list().empty());
    reopened.close();
}

TEST_F(ContentHashStoreTest, DamagedTableShapeIsRecreatedEmpty) {
    track("intro.md", "x");
    store->close();
    {
        const database::DBConnection conn(dbPath);
        conn.execRaw("DROP TABLE tracked_artifacts;"
                     "CREATE TABLE tracked_artifacts (source_id TEXT, path TEXT);");
    }

    auto db2 = std::make_shared<database::Database>(dbPath);
    ContentHashStore reopened(db2);
    ASSERT_NO_THROW(reopened.open());
    EXPECT_TRUE(reopened.listArtifacts("docs-main").empty());
    EXPECT_TRUE(sources::Registry(db2).list().empty());

    // The rebuilt store is fully usable
    sources::Registry(db2).registerSource(sources::model::Source("docs-main", "https://example.test/repo", 0));
    EXPECT_NE(sources::Registry(db2).get("docs-main"), nullptr);
    reopened.close();
}

TEST_F(ContentHashStoreTest, SchemaVersionMismatchRebuildsStore) {
    track("intro.md", "old");
    store->close();
    {
        const database::DBConnection conn(dbPath);
        conn.execRaw("UPDATE schema_metadata SET value = '0' WHERE key = 'version';");
    }

    auto db2 = std::make_shared<database::Database>(dbPath);
    ContentHashStore reopened(db2);
    reopened.open();
    EXPECT_TRUE(reopened.listArtifacts("docs-main").empty());
    EXPECT_TRUE(sources::Registry(db2).list().empty());
    reopened.close();
}
