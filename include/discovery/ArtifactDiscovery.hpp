#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mds::config { struct DiscoveryConfig; }
namespace mds::fetch { class ConditionalFetcher; }
namespace mds::sources::model { struct Source; }
namespace mds::sync { class CacheLayout; }

namespace mds::discovery {

struct Discovery {
    std::vector<std::string> paths;
    std::optional<std::string> manifest_etag;
    std::optional<std::string> error;

    [[nodiscard]] bool ok() const { return !error.has_value(); }
};

class ArtifactDiscovery {
public:
    virtual ~ArtifactDiscovery() = default;

    // Enumerates the relative artifact paths a source offers. Failures are
    // reported through Discovery::error, never thrown.
    [[nodiscard]] virtual Discovery discover(const sources::model::Source& source, bool force) = 0;
};

// Drops unsafe entries with a warning, keeps the first of any duplicates and,
// when extensions is non-empty, only paths ending in one of them
std::vector<std::string> sanitizePaths(const std::vector<std::string>& raw,
                                       const std::vector<std::string>& extensions,
                                       const std::string& sourceId);

std::shared_ptr<ArtifactDiscovery> makeDiscovery(const config::DiscoveryConfig& cfg,
                                                 std::shared_ptr<fetch::ConditionalFetcher> fetcher,
                                                 std::shared_ptr<sync::CacheLayout> layout);

}
