#pragma once

#include "resolve/model/MergedArtifactSet.hpp"

#include <string>
#include <vector>

namespace mds::resolve {

// Merges per-source artifact sets into one view. Lower priority value wins;
// equal priorities fall back to source id order.
class PriorityResolver {
public:
    [[nodiscard]] model::MergedArtifactSet resolve(std::vector<model::SourceArtifacts> perSource) const;

    // "agents/research.md" -> "research"
    [[nodiscard]] static std::string logicalName(const std::string& path);
};

}
