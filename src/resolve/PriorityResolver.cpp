#include "resolve/PriorityResolver.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <filesystem>

using namespace mds::resolve;
using namespace mds::resolve::model;

std::string PriorityResolver::logicalName(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

MergedArtifactSet PriorityResolver::resolve(std::vector<SourceArtifacts> perSource) const {
    std::ranges::stable_sort(perSource, [](const SourceArtifacts& a, const SourceArtifacts& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.source_id < b.source_id;
    });

    MergedArtifactSet merged;

    for (auto& source : perSource) {
        std::ranges::sort(source.artifacts, {}, &ArtifactRef::path);

        for (const auto& artifact : source.artifacts) {
            auto name = logicalName(artifact.path);
            if (name.empty()) continue;

            const auto it = merged.artifacts.find(name);
            if (it == merged.artifacts.end()) {
                merged.artifacts.emplace(name, ResolvedArtifact{
                    name, source.source_id, source.priority,
                    artifact.path, artifact.content_hash, artifact.local_cache_path
                });
                continue;
            }

            const auto& winner = it->second;
            ShadowedConflict conflict{
                name, winner.source_id, winner.path,
                source.source_id, artifact.path, source.priority,
                winner.priority == source.priority
            };

            if (conflict.equal_priority && winner.source_id != source.source_id)
                log::Registry::resolve()->warn(
                    "[PriorityResolver] Sources '{}' and '{}' share priority {} and both offer '{}'; keeping '{}'",
                    winner.source_id, source.source_id, source.priority, name, winner.source_id);
            else
                log::Registry::resolve()->debug("[PriorityResolver] '{}' from '{}' ({}) shadowed by '{}' ({})",
                                                name, source.source_id, artifact.path, winner.source_id, winner.path);

            merged.conflicts.push_back(std::move(conflict));
        }
    }

    log::Registry::resolve()->info("[PriorityResolver] Resolved {} artifacts from {} sources ({} shadowed)",
                                   merged.artifacts.size(), perSource.size(), merged.conflicts.size());
    return merged;
}
