#pragma once

#include "config/Config.hpp"
#include "resolve/model/MergedArtifactSet.hpp"
#include "sync/model/SyncReport.hpp"

#include <memory>
#include <string>

namespace mds::database { class Database; }
namespace mds::discovery { class ArtifactDiscovery; }
namespace mds::fetch { class ConditionalFetcher; class HttpClient; }
namespace mds::resolve { class PriorityResolver; }
namespace mds::sources { class Registry; }
namespace mds::store { class ContentHashStore; }
namespace mds::sync { class CacheLayout; class Orchestrator; }

namespace mds::services {

// Wires the engine together from a Config. Owns the state store for its
// lifetime; collaborators (CLI, deployment) talk to this.
class SyncService {
public:
    explicit SyncService(const config::Config& cfg, std::shared_ptr<fetch::HttpClient> client = nullptr);
    ~SyncService();

    SyncService(const SyncService&) = delete;
    SyncService& operator=(const SyncService&) = delete;

    sync::model::SyncReport sync(bool force = false);

    // Merged view over everything currently tracked for the enabled sources
    [[nodiscard]] resolve::model::MergedArtifactSet resolve() const;

    // Drops the source, its tracked state and its cache directory
    void removeSource(const std::string& id);

    [[nodiscard]] const std::shared_ptr<sources::Registry>& registry() const { return registry_; }
    [[nodiscard]] const std::shared_ptr<store::ContentHashStore>& store() const { return store_; }
    [[nodiscard]] const std::shared_ptr<sync::Orchestrator>& orchestrator() const { return orchestrator_; }
    [[nodiscard]] const std::shared_ptr<sync::CacheLayout>& layout() const { return layout_; }

private:
    std::shared_ptr<database::Database> db_;
    std::shared_ptr<sources::Registry> registry_;
    std::shared_ptr<fetch::ConditionalFetcher> fetcher_;
    std::shared_ptr<sync::CacheLayout> layout_;
    std::shared_ptr<discovery::ArtifactDiscovery> discovery_;
    std::shared_ptr<store::ContentHashStore> store_;
    std::shared_ptr<sync::Orchestrator> orchestrator_;
    std::shared_ptr<resolve::PriorityResolver> resolver_;
};

}
