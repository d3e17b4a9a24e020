#include "resolve/model/MergedArtifactSet.hpp"

#include <nlohmann/json.hpp>

namespace mds::resolve::model {

const ResolvedArtifact* MergedArtifactSet::find(const std::string& name) const {
    const auto it = artifacts.find(name);
    return it == artifacts.end() ? nullptr : &it->second;
}

std::vector<ShadowedConflict> MergedArtifactSet::conflictsFor(const std::string& name) const {
    std::vector<ShadowedConflict> out;
    for (const auto& c : conflicts)
        if (c.name == name) out.push_back(c);
    return out;
}

void to_json(nlohmann::json& j, const ResolvedArtifact& a) {
    j = {
        {"name", a.name},
        {"source_id", a.source_id},
        {"priority", a.priority},
        {"path", a.path},
        {"content_hash", a.content_hash},
        {"local_cache_path", a.local_cache_path.string()}
    };
}

void to_json(nlohmann::json& j, const ShadowedConflict& c) {
    j = {
        {"name", c.name},
        {"winner", {{"source_id", c.winner_source_id}, {"path", c.winner_path}}},
        {"shadowed", {{"source_id", c.shadowed_source_id}, {"path", c.shadowed_path}, {"priority", c.shadowed_priority}}},
        {"equal_priority", c.equal_priority}
    };
}

void to_json(nlohmann::json& j, const MergedArtifactSet& s) {
    j = nlohmann::json::object();
    auto& artifacts = j["artifacts"] = nlohmann::json::object();
    for (const auto& [name, artifact] : s.artifacts) artifacts[name] = artifact;
    j["conflicts"] = s.conflicts;
}

}
