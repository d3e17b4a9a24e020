#include "crypto/util/hash.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>
#include <stdexcept>

namespace {

std::string toHex(const unsigned char* digest, const size_t len) {
    std::ostringstream result;
    for (size_t i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return result.str();
}

}

namespace mds::crypto::hash {

std::string sha256Hex(const std::string_view data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string sha256File(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("Failed to initialize SHA-256 digest");

    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0 && EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1)
            throw std::runtime_error("Failed to hash file: " + filepath.string());
    }
    if (file.bad()) throw std::runtime_error("Failed to read file for hashing: " + filepath.string());

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1)
        throw std::runtime_error("Failed to finalize SHA-256 digest");

    return toHex(hash, len);
}

}
