#pragma once

#include <string>
#include <string_view>

namespace mds::util {

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

// Finds the ETag of the final response in a raw header dump. Header names are
// matched case-insensitively and earlier blocks (redirect hops) are ignored.
[[nodiscard]] bool extractETag(const std::string& respHdr, std::string& etagOut);

void ensureCurlGlobalInit();
void trimInPlace(std::string& s);

// http or https scheme with a non-empty host, checked with curl's URL parser
[[nodiscard]] bool isHttpUrl(const std::string& url);

std::string joinUrl(std::string_view base, std::string_view rel);

}
