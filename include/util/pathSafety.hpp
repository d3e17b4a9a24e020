#pragma once

#include <string>
#include <string_view>

namespace mds::util {

constexpr size_t MAX_RELATIVE_PATH_BYTES = 1024;

// Non-empty, relative, '/'-separated, no '.', '..' or empty segments,
// no backslashes or control characters, at most MAX_RELATIVE_PATH_BYTES.
[[nodiscard]] bool isSafeRelativePath(std::string_view path);

// Strips leading and trailing '/'
std::string stripSlashes(std::string_view path);

}
