#include "util/http.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <curl/curl.h>

namespace mds::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

bool extractETag(const std::string& respHdr, std::string& etagOut) {
    std::string found;
    size_t pos = 0;

    while (pos < respHdr.size()) {
        auto end = respHdr.find('\n', pos);
        if (end == std::string::npos) end = respHdr.size();
        std::string line = respHdr.substr(pos, end - pos);
        pos = end + 1;

        if (!line.empty() && line.back() == '\r') line.pop_back();

        // status line opens a new response block
        if (line.starts_with("HTTP/")) {
            found.clear();
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = line.substr(0, colon);
        std::ranges::transform(name, name.begin(), [](const unsigned char c) { return std::tolower(c); });
        if (name != "etag") continue;

        found = line.substr(colon + 1);
        trimInPlace(found);
    }

    if (found.empty()) return false;
    etagOut = found;
    return true;
}

void trimInPlace(std::string& s) {
    s.erase(s.begin(), std::ranges::find_if(s.begin(), s.end(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

bool isHttpUrl(const std::string& url) {
    if (url.empty()) return false;

    CURLU* handle = curl_url();
    if (!handle) return false;

    bool valid = false;
    if (curl_url_set(handle, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK) {
        char* scheme = nullptr;
        char* host = nullptr;
        if (curl_url_get(handle, CURLUPART_SCHEME, &scheme, 0) == CURLUE_OK &&
            curl_url_get(handle, CURLUPART_HOST, &host, 0) == CURLUE_OK) {
            const std::string s(scheme);
            valid = (s == "http" || s == "https") && host && *host;
        }
        curl_free(scheme);
        curl_free(host);
    }

    curl_url_cleanup(handle);
    return valid;
}

std::string joinUrl(std::string_view base, std::string_view rel) {
    while (!base.empty() && base.back() == '/') base.remove_suffix(1);
    while (!rel.empty() && rel.front() == '/') rel.remove_prefix(1);
    if (rel.empty()) return std::string(base);

    std::string out;
    out.reserve(base.size() + rel.size() + 1);
    out.append(base).append("/").append(rel);
    return out;
}

}
