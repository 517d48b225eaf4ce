#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

class ChecksumVerifier {
public:
    static constexpr size_t DEFAULT_BLOCK_SIZE = 64 * 1024;

    // Hex-encoded SHA-256 of the file contents, read blockSize bytes at a time.
    // Throws std::runtime_error when the file cannot be read.
    static std::string digest(const std::filesystem::path& path,
                              size_t blockSize = DEFAULT_BLOCK_SIZE);

    static bool matches(const std::filesystem::path& first,
                        const std::filesystem::path& second,
                        size_t blockSize = DEFAULT_BLOCK_SIZE);

    static std::string toHex(const unsigned char* data, size_t length);
};
