#include "sync/Orchestrator.hpp"
#include "concurrency/ThreadPool.hpp"
#include "discovery/ArtifactDiscovery.hpp"
#include "fetch/ConditionalFetcher.hpp"
#include "log/Registry.hpp"
#include "sources/Registry.hpp"
#include "store/ContentHashStore.hpp"
#include "sync/CacheLayout.hpp"
#include "sync/tasks/FetchArtifact.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <future>

using namespace mds::sync;
using namespace mds::sync::model;
using namespace mds::sources::model;
using namespace mds::store::model;
using namespace std::chrono;

Orchestrator::Orchestrator(std::shared_ptr<sources::Registry> registry,
                           std::shared_ptr<discovery::ArtifactDiscovery> discovery,
                           std::shared_ptr<fetch::ConditionalFetcher> fetcher,
                           std::shared_ptr<store::ContentHashStore> store,
                           std::shared_ptr<CacheLayout> layout,
                           const Options options)
    : registry_(std::move(registry)),
      discovery_(std::move(discovery)),
      fetcher_(std::move(fetcher)),
      store_(std::move(store)),
      layout_(std::move(layout)),
      options_(options) {
    if (!registry_ || !discovery_ || !fetcher_ || !store_ || !layout_)
        throw std::invalid_argument("Orchestrator requires a registry, discovery, fetcher, store and cache layout");
}

SyncReport Orchestrator::syncAll(const bool force) {
    return sync(registry_->list(true), force);
}

SyncReport Orchestrator::sync(std::vector<std::shared_ptr<Source>> sources, const bool force) {
    std::erase_if(sources, [](const std::shared_ptr<Source>& s) { return !s || !s->enabled; });
    std::ranges::stable_sort(sources, [](const auto& a, const auto& b) {
        if (a->priority != b->priority) return a->priority < b->priority;
        return a->id < b->id;
    });

    log::Registry::sync()->info("[Orchestrator] Starting sync of {} sources{}", sources.size(), force ? " (forced)" : "");

    SyncReport report;
    report.sources.reserve(sources.size());
    for (const auto& source : sources) report.sources.push_back(syncSource(source, force));

    log::Registry::sync()->info("[Orchestrator] Sync finished: {} fetched, {} unchanged, {} failed",
                                report.totalFetched(), report.totalUnchanged(), report.totalFailed());
    return report;
}

SourceReport Orchestrator::syncSource(const std::shared_ptr<Source>& source, const bool force) {
    SourceReport report;
    report.source_id = source->id;
    report.priority = source->priority;

    const auto started = steady_clock::now();
    const auto startedAt = util::nowSeconds();

    log::Registry::sync()->info("[Orchestrator] Syncing '{}' (priority {}) from {}",
                                source->id, source->priority, source->baseUrl());

    std::optional<std::string> manifestEtag = source->last_etag;

    try {
        const auto found = discovery_->discover(*source, force);
        if (!found.ok()) {
            report.discovery_error = found.error;
            report.status = SyncRun::Status::ERROR;
            log::Registry::sync()->error("[Orchestrator] Discovery failed for '{}': {}", source->id, *found.error);
        } else {
            manifestEtag = found.manifest_etag;
            fetchAll(source, found.paths, force, report);
            report.status = SyncRun::deriveStatus(report.files_fetched, report.files_unchanged, report.files_failed);
        }
    } catch (const std::exception& e) {
        report.discovery_error = e.what();
        report.status = SyncRun::Status::ERROR;
        log::Registry::sync()->error("[Orchestrator] Sync of '{}' aborted: {}", source->id, e.what());
    }

    report.duration_ms = static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now() - started).count());
    finishPass(*source, report, startedAt, manifestEtag);
    return report;
}

void Orchestrator::fetchAll(const std::shared_ptr<Source>& source, const std::vector<std::string>& paths,
                            const bool force, SourceReport& report) {
    if (paths.empty()) return;

    const auto workers = concurrency::ThreadPool::clampWorkers(
        std::min<unsigned int>(options_.workers, static_cast<unsigned int>(paths.size())));
    concurrency::ThreadPool pool(workers);

    const std::shared_ptr<const Source> snapshot = std::make_shared<const Source>(*source);

    std::vector<std::future<FileOutcome>> futures;
    futures.reserve(paths.size());

    for (const auto& path : paths) {
        auto task = std::make_shared<tasks::FetchArtifact>(snapshot, path, force, fetcher_, store_, layout_, locks_);
        futures.push_back(task->getFuture());
        pool.submit(task);
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            report.tally(futures[i].get());
        } catch (const std::future_error& e) {
            report.tally(FileOutcome{paths[i], FileOutcome::Kind::FAILED, e.what(), false});
        }
    }

    pool.stop();
}

void Orchestrator::finishPass(const Source& source, SourceReport& report, const std::time_t startedAt,
                              const std::optional<std::string>& manifestEtag) {
    SyncRun run;
    run.source_id = source.id;
    run.started_at = startedAt;
    run.status = report.status;
    run.files_fetched = report.files_fetched;
    run.files_unchanged = report.files_unchanged;
    run.files_failed = report.files_failed;
    run.error_detail = report.errorDetail();
    run.duration_ms = report.duration_ms;

    try {
        report.run_id = store_->recordSyncRun(run);
    } catch (const std::exception& e) {
        log::Registry::sync()->error("[Orchestrator] Failed to record sync run for '{}': {}", source.id, e.what());
    }

    try {
        registry_->recordSyncMetadata(source.id, util::nowSeconds(), manifestEtag);
    } catch (const std::exception& e) {
        log::Registry::sync()->error("[Orchestrator] Failed to update sync metadata for '{}': {}", source.id, e.what());
    }

    log::Registry::audit()->info("sync source={} run={} status={} fetched={} unchanged={} failed={} duration_ms={}",
                                 source.id, report.run_id, SyncRun::toString(report.status), report.files_fetched,
                                 report.files_unchanged, report.files_failed, report.duration_ms);

    const auto level = report.status == SyncRun::Status::SUCCESS ? spdlog::level::info : spdlog::level::warn;
    log::Registry::sync()->log(level, "[Orchestrator] '{}' finished {}: {} fetched, {} unchanged, {} failed in {} ms",
                               source.id, SyncRun::toString(report.status), report.files_fetched,
                               report.files_unchanged, report.files_failed, report.duration_ms);

    try {
        store_->pruneRunsOlderThan(options_.history_retention);
    } catch (const std::exception& e) {
        log::Registry::sync()->warn("[Orchestrator] Pruning sync history failed: {}", e.what());
    }
}

std::map<std::string, bool> Orchestrator::checkForUpdates(const Source& source) const {
    std::map<std::string, bool> out;
    for (const auto& artifact : store_->listArtifacts(source.id)) {
        const auto changed = fetcher_->probe(source.artifactUrl(artifact->path), artifact->etag);
        out[artifact->path] = changed.value_or(false);
    }

    const auto n = std::ranges::count_if(out, [](const auto& kv) { return kv.second; });
    log::Registry::sync()->info("[Orchestrator] '{}' has {} of {} artifacts changed upstream", source.id, n, out.size());
    return out;
}

std::vector<mds::resolve::model::SourceArtifacts>
Orchestrator::collect(const std::vector<std::shared_ptr<Source>>& sources) const {
    std::vector<resolve::model::SourceArtifacts> out;
    out.reserve(sources.size());

    for (const auto& source : sources) {
        if (!source) continue;

        resolve::model::SourceArtifacts entry;
        entry.source_id = source->id;
        entry.priority = source->priority;
        for (const auto& artifact : store_->listArtifacts(source->id))
            entry.artifacts.push_back({artifact->path, artifact->content_hash, artifact->local_cache_path});

        out.push_back(std::move(entry));
    }

    return out;
}
