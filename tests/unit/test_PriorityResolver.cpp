#include "resolve/PriorityResolver.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace mds::resolve;
using namespace mds::resolve::model;

namespace {

SourceArtifacts makeSource(const std::string& id, const int priority, const std::vector<std::string>& paths) {
    SourceArtifacts s;
    s.source_id = id;
    s.priority = priority;
    for (const auto& p : paths) s.artifacts.push_back({p, "hash-" + id + "-" + p, "/cache/" + id + "/" + p});
    return s;
}

}

TEST(PriorityResolverTest, LogicalNameIsFileStem) {
    EXPECT_EQ(PriorityResolver::logicalName("agents/research.md"), "research");
    EXPECT_EQ(PriorityResolver::logicalName("research.md"), "research");
    EXPECT_EQ(PriorityResolver::logicalName("a/b/writer.agent.md"), "writer.agent");
}

TEST(PriorityResolverTest, LowerPriorityValueWins) {
    const PriorityResolver resolver;
    const auto merged = resolver.resolve({
        makeSource("research-fork", 10, {"research.md", "extra.md"}),
        makeSource("docs-main", 0, {"agents/research.md"}),
    });

    ASSERT_EQ(merged.artifacts.size(), 2u);
    const auto* research = merged.find("research");
    ASSERT_NE(research, nullptr);
    EXPECT_EQ(research->source_id, "docs-main");
    EXPECT_EQ(research->path, "agents/research.md");
    EXPECT_EQ(research->priority, 0);
    EXPECT_EQ(research->local_cache_path.string(), "/cache/docs-main/agents/research.md");

    ASSERT_NE(merged.find("extra"), nullptr);
    EXPECT_EQ(merged.find("extra")->source_id, "research-fork");

    const auto conflicts = merged.conflictsFor("research");
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].winner_source_id, "docs-main");
    EXPECT_EQ(conflicts[0].shadowed_source_id, "research-fork");
    EXPECT_EQ(conflicts[0].shadowed_priority, 10);
    EXPECT_FALSE(conflicts[0].equal_priority);
}

TEST(PriorityResolverTest, InputOrderDoesNotMatter) {
    const PriorityResolver resolver;
    const auto a = resolver.resolve({makeSource("low", 5, {"x.md"}), makeSource("high", 1, {"x.md"})});
    const auto b = resolver.resolve({makeSource("high", 1, {"x.md"}), makeSource("low", 5, {"x.md"})});

    EXPECT_EQ(a.find("x")->source_id, "high");
    EXPECT_EQ(b.find("x")->source_id, "high");
}

TEST(PriorityResolverTest, EqualPriorityFallsBackToSourceId) {
    const PriorityResolver resolver;
    const auto merged = resolver.resolve({
        makeSource("zeta", 3, {"writer.md"}),
        makeSource("alpha", 3, {"writer.md"}),
    });

    EXPECT_EQ(merged.find("writer")->source_id, "alpha");
    ASSERT_EQ(merged.conflicts.size(), 1u);
    EXPECT_TRUE(merged.conflicts[0].equal_priority);
    EXPECT_EQ(merged.conflicts[0].shadowed_source_id, "zeta");
}

TEST(PriorityResolverTest, DuplicateNameWithinSourcePrefersSmallestPath) {
    const PriorityResolver resolver;
    const auto merged = resolver.resolve({makeSource("docs-main", 0, {"b/research.md", "a/research.md"})});

    EXPECT_EQ(merged.find("research")->path, "a/research.md");
    ASSERT_EQ(merged.conflicts.size(), 1u);
    EXPECT_EQ(merged.conflicts[0].shadowed_path, "b/research.md");
}

TEST(PriorityResolverTest, EmptyInputYieldsEmptySet) {
    const auto merged = PriorityResolver().resolve({});
    EXPECT_TRUE(merged.artifacts.empty());
    EXPECT_TRUE(merged.conflicts.empty());
    EXPECT_EQ(merged.find("anything"), nullptr);
}

TEST(PriorityResolverTest, SerializesToJson) {
    const auto merged = PriorityResolver().resolve({
        makeSource("docs-main", 0, {"research.md"}),
        makeSource("fork", 10, {"research.md"}),
    });

    const nlohmann::json j = merged;
    EXPECT_EQ(j["artifacts"]["research"]["source_id"], "docs-main");
    ASSERT_EQ(j["conflicts"].size(), 1u);
    EXPECT_EQ(j["conflicts"][0]["shadowed"]["source_id"], "fork");
}
