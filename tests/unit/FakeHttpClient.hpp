#pragma once

#include "fetch/HttpClient.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mds::test {

// Scripted in-memory origin. Honors If-None-Match, can inject status codes,
// timeouts and transport errors, and counts what it served.
class FakeHttpClient final : public fetch::HttpClient {
public:
    struct Resource {
        std::string body;
        std::optional<std::string> etag;
        long status = 200;
        unsigned int timeouts = 0;
        bool unreachable = false;
    };

    // Publishes content under a fresh ETag
    void put(const std::string& url, const std::string& body) {
        std::scoped_lock lock(mutex_);
        auto& r = resources_[url];
        r.body = body;
        r.etag = "\"v" + std::to_string(++version_) + "\"";
    }

    void putWithoutEtag(const std::string& url, const std::string& body) {
        std::scoped_lock lock(mutex_);
        auto& r = resources_[url];
        r.body = body;
        r.etag.reset();
    }

    void remove(const std::string& url) {
        std::scoped_lock lock(mutex_);
        resources_.erase(url);
    }

    void setStatus(const std::string& url, const long status) {
        std::scoped_lock lock(mutex_);
        resources_[url].status = status;
    }

    void failWithTimeouts(const std::string& url, const unsigned int n) {
        std::scoped_lock lock(mutex_);
        resources_[url].timeouts = n;
    }

    void setUnreachable(const std::string& url, const bool unreachable = true) {
        std::scoped_lock lock(mutex_);
        resources_[url].unreachable = unreachable;
    }

    [[nodiscard]] std::optional<std::string> etagOf(const std::string& url) const {
        std::scoped_lock lock(mutex_);
        const auto it = resources_.find(url);
        return it == resources_.end() ? std::nullopt : it->second.etag;
    }

    [[nodiscard]] unsigned int requestCount(const std::string& url) const {
        std::scoped_lock lock(mutex_);
        const auto it = requests_.find(url);
        return it == requests_.end() ? 0 : it->second;
    }

    // Full 200 GET responses
    [[nodiscard]] unsigned int servedCount(const std::string& url) const {
        std::scoped_lock lock(mutex_);
        const auto it = served_.find(url);
        return it == served_.end() ? 0 : it->second;
    }

    [[nodiscard]] unsigned int totalServed() const {
        std::scoped_lock lock(mutex_);
        unsigned int n = 0;
        for (const auto& [_, count] : served_) n += count;
        return n;
    }

    [[nodiscard]] std::optional<std::string> lastIfNoneMatch(const std::string& url) const {
        std::scoped_lock lock(mutex_);
        const auto it = lastIfNoneMatch_.find(url);
        return it == lastIfNoneMatch_.end() ? std::nullopt : it->second;
    }

    void resetCounters() {
        std::scoped_lock lock(mutex_);
        requests_.clear();
        served_.clear();
        lastIfNoneMatch_.clear();
    }

    util::HttpResponse perform(const fetch::HttpRequest& request) override {
        std::scoped_lock lock(mutex_);
        ++requests_[request.url];

        std::optional<std::string> ifNoneMatch;
        static const std::string prefix = "If-None-Match: ";
        for (const auto& h : request.headers)
            if (h.starts_with(prefix)) ifNoneMatch = h.substr(prefix.size());
        lastIfNoneMatch_[request.url] = ifNoneMatch;

        util::HttpResponse res;
        const auto it = resources_.find(request.url);
        if (it == resources_.end()) {
            res.http = 404;
            res.hdr = "HTTP/1.1 404 Not Found\r\n\r\n";
            res.body = "Not Found";
            return res;
        }

        auto& r = it->second;
        if (r.timeouts > 0) {
            --r.timeouts;
            res.curl = CURLE_OPERATION_TIMEDOUT;
            return res;
        }
        if (r.unreachable) {
            res.curl = CURLE_COULDNT_CONNECT;
            return res;
        }
        if (r.status != 200) {
            res.http = r.status;
            res.hdr = "HTTP/1.1 " + std::to_string(r.status) + " Error\r\n\r\n";
            res.body = "error";
            return res;
        }

        const std::string etagHdr = r.etag ? "ETag: " + *r.etag + "\r\n" : "";
        if (ifNoneMatch && r.etag && *ifNoneMatch == *r.etag) {
            res.http = 304;
            res.hdr = "HTTP/1.1 304 Not Modified\r\n" + etagHdr + "\r\n";
            return res;
        }

        res.http = 200;
        res.hdr = "HTTP/1.1 200 OK\r\n" + etagHdr + "Content-Type: text/plain\r\n\r\n";
        if (request.method == fetch::HttpRequest::Method::GET) {
            res.body = r.body;
            ++served_[request.url];
        }
        return res;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Resource> resources_;
    std::map<std::string, unsigned int> requests_;
    std::map<std::string, unsigned int> served_;
    std::map<std::string, std::optional<std::string>> lastIfNoneMatch_;
    unsigned int version_ = 0;
};

}
