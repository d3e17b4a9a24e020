#pragma once

#include <string>
#include <string_view>
#include <filesystem>

namespace mds::crypto::hash {

// Lowercase hex SHA-256 of an in-memory buffer
std::string sha256Hex(std::string_view data);

// Streams the file; throws std::runtime_error if it cannot be read
std::string sha256File(const std::filesystem::path& filepath);

}
