#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace mds::resolve::model {

struct ArtifactRef {
    std::string path;
    std::string content_hash;
    std::filesystem::path local_cache_path;
};

// Everything one source currently has in the cache
struct SourceArtifacts {
    std::string source_id;
    int priority = 0;
    std::vector<ArtifactRef> artifacts;
};

struct ResolvedArtifact {
    std::string name;
    std::string source_id;
    int priority = 0;
    std::string path;
    std::string content_hash;
    std::filesystem::path local_cache_path;
};

struct ShadowedConflict {
    std::string name;
    std::string winner_source_id;
    std::string winner_path;
    std::string shadowed_source_id;
    std::string shadowed_path;
    int shadowed_priority = 0;
    bool equal_priority = false;
};

struct MergedArtifactSet {
    std::map<std::string, ResolvedArtifact> artifacts;     // keyed by logical name
    std::vector<ShadowedConflict> conflicts;

    [[nodiscard]] const ResolvedArtifact* find(const std::string& name) const;
    [[nodiscard]] std::vector<ShadowedConflict> conflictsFor(const std::string& name) const;
};

void to_json(nlohmann::json& j, const ResolvedArtifact& a);
void to_json(nlohmann::json& j, const ShadowedConflict& c);
void to_json(nlohmann::json& j, const MergedArtifactSet& s);

}
