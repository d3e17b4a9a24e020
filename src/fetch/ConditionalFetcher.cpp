#include "fetch/ConditionalFetcher.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace mds::fetch;
using namespace mds::util;

ConditionalFetcher::ConditionalFetcher(std::shared_ptr<HttpClient> client, config::FetchConfig cfg)
    : client_(std::move(client)), cfg_(std::move(cfg)) {
    if (!client_) throw std::invalid_argument("ConditionalFetcher requires an HTTP client");
}

FetchResult ConditionalFetcher::fetch(const std::string& url, const std::optional<std::string>& knownEtag,
                                      const bool force) const {
    HttpRequest req;
    req.method = HttpRequest::Method::GET;
    req.url = url;
    req.timeout = std::chrono::seconds(cfg_.timeout_seconds);

    const bool conditional = !force && knownEtag && !knownEtag->empty();
    if (conditional) req.headers.push_back("If-None-Match: " + *knownEtag);

    const auto res = performWithRetry(req);

    if (res.curl != CURLE_OK) {
        const bool timedOut = res.timedOut();
        log::Registry::fetch()->warn("[ConditionalFetcher] {} failed: {}", url, curl_easy_strerror(res.curl));
        return Error{curl_easy_strerror(res.curl), 0, timedOut};
    }

    if (res.http == 304) {
        if (!conditional) {
            log::Registry::fetch()->warn("[ConditionalFetcher] {} answered 304 to an unconditional request", url);
            return Error{"unexpected 304 for unconditional request", 304, false};
        }
        log::Registry::fetch()->debug("[ConditionalFetcher] {} not modified", url);
        return Fresh{};
    }

    if (res.http / 100 == 2) {
        Updated updated{res.body, std::nullopt};
        if (std::string etag; extractETag(res.hdr, etag)) updated.etag = std::move(etag);
        log::Registry::fetch()->debug("[ConditionalFetcher] {} updated ({} bytes, etag {})",
                                      url, updated.content.size(), updated.etag.value_or("none"));
        return updated;
    }

    if (res.http == 404) {
        log::Registry::fetch()->warn("[ConditionalFetcher] {} not found", url);
        return Error{"not found", 404, false};
    }

    log::Registry::fetch()->warn("[ConditionalFetcher] {} returned HTTP {}", url, res.http);
    return Error{fmt::format("HTTP {}", res.http), res.http, false};
}

std::optional<bool> ConditionalFetcher::probe(const std::string& url, const std::optional<std::string>& knownEtag) const {
    HttpRequest req;
    req.method = HttpRequest::Method::HEAD;
    req.url = url;
    req.timeout = std::chrono::seconds(cfg_.timeout_seconds);
    if (knownEtag && !knownEtag->empty()) req.headers.push_back("If-None-Match: " + *knownEtag);

    const auto res = performWithRetry(req);
    if (res.curl != CURLE_OK) {
        log::Registry::fetch()->warn("[ConditionalFetcher] HEAD {} failed: {}", url, curl_easy_strerror(res.curl));
        return std::nullopt;
    }

    if (res.http == 304) return false;
    if (res.http / 100 != 2) {
        log::Registry::fetch()->warn("[ConditionalFetcher] HEAD {} returned HTTP {}", url, res.http);
        return std::nullopt;
    }

    std::string remote;
    if (!extractETag(res.hdr, remote)) return true;     // no validator, assume changed
    return !knownEtag || remote != *knownEtag;
}

HttpResponse ConditionalFetcher::performWithRetry(const HttpRequest& request) const {
    const unsigned int attempts = cfg_.retry_on_timeout ? 2 : 1;

    HttpResponse res;
    for (unsigned int attempt = 1; attempt <= attempts; ++attempt) {
        res = client_->perform(request);
        if (!res.timedOut()) break;
        if (attempt < attempts)
            log::Registry::fetch()->warn("[ConditionalFetcher] {} timed out after {}s, retrying once",
                                         request.url, cfg_.timeout_seconds);
    }
    return res;
}
