#pragma once

#include "discovery/ArtifactDiscovery.hpp"

#include <string>
#include <vector>

namespace mds::discovery {

// Fixed path list, same for every source
class StaticDiscovery final : public ArtifactDiscovery {
public:
    explicit StaticDiscovery(std::vector<std::string> paths, std::vector<std::string> extensions = {});

    [[nodiscard]] Discovery discover(const sources::model::Source& source, bool force) override;

private:
    std::vector<std::string> paths_;
    std::vector<std::string> extensions_;
};

}
