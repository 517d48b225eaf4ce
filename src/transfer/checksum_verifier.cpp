#include "transfer/checksum_verifier.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

} // namespace

std::string ChecksumVerifier::digest(const std::filesystem::path& path, size_t blockSize) {
    if (blockSize == 0) {
        blockSize = DEFAULT_BLOCK_SIZE;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open " + path.string() + " for checksum");
    }

    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create OpenSSL digest context");
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }

    std::vector<char> buffer(blockSize);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = file.gcount();
        if (count > 0) {
            if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
                throw std::runtime_error("Failed to update digest for " + path.string());
            }
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Read error while hashing " + path.string());
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
        throw std::runtime_error("Failed to finalize digest for " + path.string());
    }

    return toHex(hash, hashLen);
}

bool ChecksumVerifier::matches(const std::filesystem::path& first,
                               const std::filesystem::path& second,
                               size_t blockSize) {
    return digest(first, blockSize) == digest(second, blockSize);
}

std::string ChecksumVerifier::toHex(const unsigned char* data, size_t length) {
    std::stringstream ss;
    for (size_t i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}
