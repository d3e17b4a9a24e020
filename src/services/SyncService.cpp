#include "services/SyncService.hpp"
#include "database/Database.hpp"
#include "discovery/ArtifactDiscovery.hpp"
#include "fetch/ConditionalFetcher.hpp"
#include "fetch/CurlHttpClient.hpp"
#include "log/Registry.hpp"
#include "resolve/PriorityResolver.hpp"
#include "sources/Registry.hpp"
#include "store/ContentHashStore.hpp"
#include "sync/CacheLayout.hpp"
#include "sync/Orchestrator.hpp"
#include "types/errors.hpp"

#include <fmt/format.h>

using namespace mds::services;

SyncService::SyncService(const config::Config& cfg, std::shared_ptr<fetch::HttpClient> client) {
    if (!client) client = std::make_shared<fetch::CurlHttpClient>(cfg.fetch.user_agent);

    db_ = std::make_shared<database::Database>(cfg.cache.state_db);
    store_ = std::make_shared<store::ContentHashStore>(db_);
    store_->open();

    registry_ = std::make_shared<sources::Registry>(db_);
    if (const auto added = registry_->seed(cfg.sources); added > 0)
        log::Registry::mdsync()->info("[SyncService] Registered {} configured sources", added);

    fetcher_ = std::make_shared<fetch::ConditionalFetcher>(std::move(client), cfg.fetch);
    layout_ = std::make_shared<sync::CacheLayout>(cfg.cache.root);
    discovery_ = discovery::makeDiscovery(cfg.discovery, fetcher_, layout_);
    resolver_ = std::make_shared<resolve::PriorityResolver>();

    orchestrator_ = std::make_shared<sync::Orchestrator>(
        registry_, discovery_, fetcher_, store_, layout_,
        sync::Orchestrator::Options{cfg.fetch.workers, cfg.history.retention_days});

    log::Registry::mdsync()->debug("[SyncService] Cache at {}, state at {}",
                                   cfg.cache.root.string(), cfg.cache.state_db.string());
}

SyncService::~SyncService() {
    store_->close();
}

mds::sync::model::SyncReport SyncService::sync(const bool force) {
    return orchestrator_->syncAll(force);
}

mds::resolve::model::MergedArtifactSet SyncService::resolve() const {
    return resolver_->resolve(orchestrator_->collect(registry_->list(true)));
}

void SyncService::removeSource(const std::string& id) {
    const auto source = registry_->get(id);
    if (!source) throw types::NotFoundError(fmt::format("Source '{}' not found", id));

    registry_->remove(id);

    try {
        layout_->removeSource(*source);
    } catch (const std::filesystem::filesystem_error& e) {
        log::Registry::mdsync()->warn("[SyncService] Could not remove cache for '{}': {}", id, e.what());
    }
}
