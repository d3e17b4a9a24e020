#include "sync/model/SyncReport.hpp"

#include <algorithm>
#include <numeric>
#include <nlohmann/json.hpp>

namespace mds::sync::model {

void SourceReport::tally(const FileOutcome& outcome) {
    if (outcome.refetched_after_divergence) ++divergences;

    switch (outcome.kind) {
        case FileOutcome::Kind::FETCHED: ++files_fetched; break;
        case FileOutcome::Kind::UNCHANGED: ++files_unchanged; break;
        case FileOutcome::Kind::FAILED:
            ++files_failed;
            errors.push_back({outcome.path, outcome.detail});
            break;
    }
}

namespace {

// Cut to at most max bytes without splitting a UTF-8 sequence
void truncateUtf8(std::string& s, size_t max) {
    if (s.size() <= max) return;
    size_t end = max;
    while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) --end;
    s.resize(end);
}

}

std::string SourceReport::errorDetail() const {
    std::string out;
    if (discovery_error) out = *discovery_error;

    for (const auto& e : errors) {
        std::string line = e.path + ": " + e.detail;
        if (out.empty()) {
            out = std::move(line);
            continue;
        }
        // Only whole lines after the first
        if (out.size() + 1 + line.size() > MAX_ERROR_DETAIL_BYTES) break;
        out += '\n';
        out += line;
    }

    truncateUtf8(out, MAX_ERROR_DETAIL_BYTES);
    return out;
}

uint32_t SyncReport::totalFetched() const {
    return std::accumulate(sources.begin(), sources.end(), 0u,
                           [](const uint32_t acc, const SourceReport& r) { return acc + r.files_fetched; });
}

uint32_t SyncReport::totalUnchanged() const {
    return std::accumulate(sources.begin(), sources.end(), 0u,
                           [](const uint32_t acc, const SourceReport& r) { return acc + r.files_unchanged; });
}

uint32_t SyncReport::totalFailed() const {
    return std::accumulate(sources.begin(), sources.end(), 0u,
                           [](const uint32_t acc, const SourceReport& r) { return acc + r.files_failed; });
}

bool SyncReport::allSucceeded() const {
    return std::ranges::all_of(sources, [](const SourceReport& r) {
        return r.status == store::model::SyncRun::Status::SUCCESS;
    });
}

const SourceReport* SyncReport::find(const std::string& sourceId) const {
    const auto it = std::ranges::find(sources, sourceId, &SourceReport::source_id);
    return it == sources.end() ? nullptr : &*it;
}

std::string_view to_string(const FileOutcome::Kind kind) {
    switch (kind) {
        case FileOutcome::Kind::FETCHED: return "fetched";
        case FileOutcome::Kind::UNCHANGED: return "unchanged";
        case FileOutcome::Kind::FAILED: return "failed";
    }
    return "failed";
}

void to_json(nlohmann::json& j, const FileError& e) {
    j = {{"path", e.path}, {"detail", e.detail}};
}

void to_json(nlohmann::json& j, const SourceReport& r) {
    j = {
        {"source_id", r.source_id},
        {"priority", r.priority},
        {"status", store::model::SyncRun::toString(r.status)},
        {"files_fetched", r.files_fetched},
        {"files_unchanged", r.files_unchanged},
        {"files_failed", r.files_failed},
        {"divergences", r.divergences},
        {"errors", r.errors},
        {"run_id", r.run_id},
        {"duration_ms", r.duration_ms}
    };
    j["discovery_error"] = r.discovery_error ? nlohmann::json(*r.discovery_error) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const SyncReport& r) {
    j = {
        {"sources", r.sources},
        {"files_fetched", r.totalFetched()},
        {"files_unchanged", r.totalUnchanged()},
        {"files_failed", r.totalFailed()},
        {"success", r.allSucceeded()}
    };
}

}
