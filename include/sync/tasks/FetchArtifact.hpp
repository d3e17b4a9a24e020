#pragma once

#include "concurrency/Task.hpp"
#include "fetch/FetchResult.hpp"
#include "sync/model/SyncReport.hpp"

#include <memory>
#include <string>

namespace mds::concurrency { class KeyedMutex; }
namespace mds::fetch { class ConditionalFetcher; }
namespace mds::sources::model { struct Source; }
namespace mds::store { class ContentHashStore; }

namespace mds::sync {

class CacheLayout;

namespace tasks {

// Fetches one artifact of one source, verifies it against the store and
// writes it into the cache. Always fulfils its promise with a FileOutcome.
struct FetchArtifact final : concurrency::PromisedTask<model::FileOutcome> {
    FetchArtifact(std::shared_ptr<const sources::model::Source> source,
                  std::string path,
                  bool force,
                  std::shared_ptr<fetch::ConditionalFetcher> fetcher,
                  std::shared_ptr<store::ContentHashStore> store,
                  std::shared_ptr<CacheLayout> layout,
                  concurrency::KeyedMutex& locks);

    void operator()() override;

private:
    std::shared_ptr<const sources::model::Source> source_;
    std::string path_;
    bool force_;
    std::shared_ptr<fetch::ConditionalFetcher> fetcher_;
    std::shared_ptr<store::ContentHashStore> store_;
    std::shared_ptr<CacheLayout> layout_;
    concurrency::KeyedMutex& locks_;

    [[nodiscard]] model::FileOutcome run() const;
    [[nodiscard]] model::FileOutcome persist(const fetch::Updated& updated, bool afterDivergence) const;
};

}

}
