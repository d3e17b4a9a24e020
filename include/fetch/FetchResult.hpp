#pragma once

#include <optional>
#include <string>
#include <variant>

namespace mds::fetch {

// 304: the cached copy is still current
struct Fresh {};

struct Updated {
    std::string content;
    std::optional<std::string> etag;    // absent when the server sent none
};

struct Error {
    std::string detail;
    long http_status = 0;               // 0 for transport failures
    bool timed_out = false;
};

using FetchResult = std::variant<Fresh, Updated, Error>;

}
