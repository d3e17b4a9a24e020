#pragma once

#include "config/Config.hpp"
#include "discovery/ArtifactDiscovery.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mds::discovery {

// Reads a manifest published next to the artifacts. The plain format is one
// relative path per line with '#' comments; the json format is an array of
// paths or a tree listing {"tree":[{"path":..., "type":"blob"}]}.
class ManifestDiscovery final : public ArtifactDiscovery {
public:
    ManifestDiscovery(std::shared_ptr<fetch::ConditionalFetcher> fetcher,
                      std::shared_ptr<sync::CacheLayout> layout,
                      config::DiscoveryConfig cfg);

    [[nodiscard]] Discovery discover(const sources::model::Source& source, bool force) override;

    [[nodiscard]] static std::vector<std::string> parsePlain(const std::string& body);

    // Throws std::invalid_argument (or nlohmann::json::exception) on malformed input
    [[nodiscard]] static std::vector<std::string> parseJson(const std::string& body);

private:
    std::shared_ptr<fetch::ConditionalFetcher> fetcher_;
    std::shared_ptr<sync::CacheLayout> layout_;
    config::DiscoveryConfig cfg_;
};

}
