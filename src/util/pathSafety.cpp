#include "util/pathSafety.hpp"

namespace mds::util {

bool isSafeRelativePath(const std::string_view path) {
    if (path.empty() || path.size() > MAX_RELATIVE_PATH_BYTES) return false;
    if (path.front() == '/') return false;

    for (const char c : path) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '\\' || uc < 0x20 || uc == 0x7f) return false;
    }

    size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        const auto segment = path.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") return false;
        start = end + 1;
    }

    return true;
}

std::string stripSlashes(std::string_view path) {
    while (!path.empty() && path.front() == '/') path.remove_prefix(1);
    while (!path.empty() && path.back() == '/') path.remove_suffix(1);
    return std::string(path);
}

}
