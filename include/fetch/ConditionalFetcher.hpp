#pragma once

#include "config/Config.hpp"
#include "fetch/FetchResult.hpp"
#include "fetch/HttpClient.hpp"

#include <memory>
#include <optional>
#include <string>

namespace mds::fetch {

class ConditionalFetcher {
public:
    ConditionalFetcher(std::shared_ptr<HttpClient> client, config::FetchConfig cfg);

    // Sends If-None-Match unless force is set or no ETag is known. Never throws
    // for network or HTTP failures; those come back as Error.
    [[nodiscard]] FetchResult fetch(const std::string& url, const std::optional<std::string>& knownEtag,
                                    bool force = false) const;

    // HEAD probe: true if the remote ETag differs from knownEtag, empty if the
    // remote could not be asked
    [[nodiscard]] std::optional<bool> probe(const std::string& url, const std::optional<std::string>& knownEtag) const;

    [[nodiscard]] const config::FetchConfig& config() const { return cfg_; }

private:
    std::shared_ptr<HttpClient> client_;
    config::FetchConfig cfg_;

    util::HttpResponse performWithRetry(const HttpRequest& request) const;
};

}
