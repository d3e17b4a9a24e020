#include "sync/tasks/FetchArtifact.hpp"
#include "concurrency/KeyedMutex.hpp"
#include "crypto/util/hash.hpp"
#include "fetch/ConditionalFetcher.hpp"
#include "log/Registry.hpp"
#include "sources/model/Source.hpp"
#include "store/ContentHashStore.hpp"
#include "sync/CacheLayout.hpp"
#include "util/files.hpp"

using namespace mds::sync;
using namespace mds::sync::tasks;
using namespace mds::sync::model;
using namespace mds::fetch;

FetchArtifact::FetchArtifact(std::shared_ptr<const sources::model::Source> source,
                             std::string path,
                             const bool force,
                             std::shared_ptr<ConditionalFetcher> fetcher,
                             std::shared_ptr<store::ContentHashStore> store,
                             std::shared_ptr<CacheLayout> layout,
                             concurrency::KeyedMutex& locks)
    : source_(std::move(source)),
      path_(std::move(path)),
      force_(force),
      fetcher_(std::move(fetcher)),
      store_(std::move(store)),
      layout_(std::move(layout)),
      locks_(locks) {}

void FetchArtifact::operator()() {
    try {
        promise.set_value(run());
    } catch (const std::exception& e) {
        log::Registry::sync()->error("[FetchArtifact] {}:{} failed: {}", source_->id, path_, e.what());
        promise.set_value(FileOutcome{path_, FileOutcome::Kind::FAILED, e.what(), false});
    }
}

FileOutcome FetchArtifact::run() const {
    const auto lock = locks_.lock(source_->id + '\n' + path_);

    const auto url = source_->artifactUrl(path_);
    const auto known = store_->getArtifact(source_->id, path_);
    const auto knownEtag = known ? known->etag : std::nullopt;

    auto result = fetcher_->fetch(url, knownEtag, force_);
    bool divergence = false;

    if (std::holds_alternative<Fresh>(result)) {
        const auto integrity = store_->verifyLocal(source_->id, path_);
        if (integrity == store::Integrity::Ok)
            return {path_, FileOutcome::Kind::UNCHANGED, {}, false};

        log::Registry::sync()->warn("[FetchArtifact] Hash/ETag divergence for {}:{} ({}), forcing refetch",
                                    source_->id, path_, store::to_string(integrity));
        divergence = true;
        result = fetcher_->fetch(url, std::nullopt, true);
    }

    if (const auto* updated = std::get_if<Updated>(&result)) return persist(*updated, divergence);

    if (const auto* err = std::get_if<Error>(&result))
        return {path_, FileOutcome::Kind::FAILED, err->detail, divergence};

    return {path_, FileOutcome::Kind::FAILED, "server reported not modified for an unconditional request", divergence};
}

FileOutcome FetchArtifact::persist(const Updated& updated, const bool afterDivergence) const {
    const auto target = layout_->artifactPath(*source_, path_);
    util::writeFileAtomic(target, updated.content);

    const auto hash = crypto::hash::sha256Hex(updated.content);
    store_->recordFile(source_->id, path_, hash, target, updated.content.size(), updated.etag);

    log::Registry::sync()->debug("[FetchArtifact] Stored {}:{} ({} bytes)", source_->id, path_, updated.content.size());
    return {path_, FileOutcome::Kind::FETCHED, {}, afterDivergence};
}
