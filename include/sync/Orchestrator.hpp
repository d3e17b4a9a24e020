#pragma once

#include "concurrency/KeyedMutex.hpp"
#include "resolve/model/MergedArtifactSet.hpp"
#include "sync/model/SyncReport.hpp"

#include <chrono>
#include <ctime>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mds::discovery { class ArtifactDiscovery; }
namespace mds::fetch { class ConditionalFetcher; }
namespace mds::sources { class Registry; }
namespace mds::sources::model { struct Source; }
namespace mds::store { class ContentHashStore; }

namespace mds::sync {

class CacheLayout;

class Orchestrator {
public:
    struct Options {
        unsigned int workers = 4;
        std::chrono::days history_retention{30};
    };

    Orchestrator(std::shared_ptr<sources::Registry> registry,
                 std::shared_ptr<discovery::ArtifactDiscovery> discovery,
                 std::shared_ptr<fetch::ConditionalFetcher> fetcher,
                 std::shared_ptr<store::ContentHashStore> store,
                 std::shared_ptr<CacheLayout> layout,
                 Options options);

    // Syncs the enabled sources in ascending priority order. Never throws for
    // per-file or per-source failures; those are carried in the report.
    model::SyncReport sync(std::vector<std::shared_ptr<sources::model::Source>> sources, bool force = false);

    model::SyncReport syncAll(bool force = false);

    model::SourceReport syncSource(const std::shared_ptr<sources::model::Source>& source, bool force = false);

    // HEAD-probes every tracked artifact; true where the remote ETag moved.
    // Paths whose probe failed are reported as unchanged.
    [[nodiscard]] std::map<std::string, bool> checkForUpdates(const sources::model::Source& source) const;

    // Tracked artifacts per source, ready for PriorityResolver
    [[nodiscard]] std::vector<resolve::model::SourceArtifacts>
    collect(const std::vector<std::shared_ptr<sources::model::Source>>& sources) const;

private:
    std::shared_ptr<sources::Registry> registry_;
    std::shared_ptr<discovery::ArtifactDiscovery> discovery_;
    std::shared_ptr<fetch::ConditionalFetcher> fetcher_;
    std::shared_ptr<store::ContentHashStore> store_;
    std::shared_ptr<CacheLayout> layout_;
    Options options_;
    concurrency::KeyedMutex locks_;

    void fetchAll(const std::shared_ptr<sources::model::Source>& source,
                  const std::vector<std::string>& paths, bool force, model::SourceReport& report);

    void finishPass(const sources::model::Source& source, model::SourceReport& report,
                    std::time_t startedAt, const std::optional<std::string>& manifestEtag);
};

}
