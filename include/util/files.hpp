#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace mds::util {

std::string readFileToString(const std::filesystem::path& path);

// Writes to a sibling temp file and renames it over the target, so readers
// see either the old or the new content, never a partial file.
void writeFileAtomic(const std::filesystem::path& target, std::string_view content);

std::string generate_random_suffix(size_t length = 8);

}
