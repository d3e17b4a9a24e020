#include "discovery/ManifestDiscovery.hpp"
#include "fetch/ConditionalFetcher.hpp"
#include "log/Registry.hpp"
#include "sources/model/Source.hpp"
#include "sync/CacheLayout.hpp"
#include "util/files.hpp"
#include "util/http.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace mds::discovery;
using namespace mds::fetch;
using namespace mds::sources::model;

ManifestDiscovery::ManifestDiscovery(std::shared_ptr<ConditionalFetcher> fetcher,
                                     std::shared_ptr<sync::CacheLayout> layout,
                                     config::DiscoveryConfig cfg)
    : fetcher_(std::move(fetcher)), layout_(std::move(layout)), cfg_(std::move(cfg)) {
    if (!fetcher_ || !layout_) throw std::invalid_argument("ManifestDiscovery requires a fetcher and a cache layout");
}

Discovery ManifestDiscovery::discover(const Source& source, const bool force) {
    Discovery out;

    const auto url = source.artifactUrl(cfg_.manifest);
    const auto cached = layout_->manifestPath(source);

    // Without a cached copy a 304 would leave nothing to read
    std::error_code ec;
    const bool haveCached = std::filesystem::is_regular_file(cached, ec);
    const auto knownEtag = haveCached ? source.last_etag : std::nullopt;

    std::optional<std::string> body;

    const auto accept = [&](const Updated& updated) {
        body = updated.content;
        out.manifest_etag = updated.etag;
        try {
            util::writeFileAtomic(cached, updated.content);
        } catch (const std::exception& e) {
            log::Registry::sync()->warn("[ManifestDiscovery] Could not cache manifest for '{}': {}", source.id, e.what());
        }
    };

    auto result = fetcher_->fetch(url, knownEtag, force);

    if (std::holds_alternative<Fresh>(result)) {
        try {
            body = util::readFileToString(cached);
            out.manifest_etag = source.last_etag;
        } catch (const std::exception& e) {
            log::Registry::sync()->warn("[ManifestDiscovery] Cached manifest for '{}' unreadable ({}), refetching",
                                        source.id, e.what());
            result = fetcher_->fetch(url, std::nullopt, true);
        }
    }

    if (const auto* updated = std::get_if<Updated>(&result)) accept(*updated);

    if (const auto* err = std::get_if<Error>(&result)) {
        out.error = fmt::format("manifest {}: {}", cfg_.manifest, err->detail);
        return out;
    }

    if (!body) {
        out.error = fmt::format("manifest {}: no content available", cfg_.manifest);
        return out;
    }

    std::vector<std::string> raw;
    try {
        raw = cfg_.format == config::DiscoveryConfig::Format::Json ? parseJson(*body) : parsePlain(*body);
    } catch (const std::exception& e) {
        out.error = fmt::format("manifest {} is malformed: {}", cfg_.manifest, e.what());
        return out;
    }

    out.paths = sanitizePaths(raw, cfg_.extensions, source.id);
    log::Registry::sync()->debug("[ManifestDiscovery] Source '{}' lists {} artifacts ({} raw entries)",
                                 source.id, out.paths.size(), raw.size());
    return out;
}

std::vector<std::string> ManifestDiscovery::parsePlain(const std::string& body) {
    std::vector<std::string> out;
    std::istringstream in(body);
    std::string line;

    while (std::getline(in, line)) {
        util::trimInPlace(line);
        if (line.empty() || line.front() == '#') continue;
        out.push_back(line);
    }

    return out;
}

std::vector<std::string> ManifestDiscovery::parseJson(const std::string& body) {
    const auto doc = nlohmann::json::parse(body);
    std::vector<std::string> out;

    if (doc.is_array()) {
        for (const auto& entry : doc) {
            if (!entry.is_string()) throw std::invalid_argument("manifest array entries must be strings");
            out.push_back(entry.get<std::string>());
        }
        return out;
    }

    if (doc.is_object() && doc.contains("tree") && doc["tree"].is_array()) {
        for (const auto& entry : doc["tree"]) {
            if (!entry.is_object() || !entry.contains("path")) continue;
            if (entry.value("type", std::string("blob")) != "blob") continue;
            out.push_back(entry["path"].get<std::string>());
        }
        return out;
    }

    throw std::invalid_argument("expected a JSON array or an object with a 'tree' array");
}
