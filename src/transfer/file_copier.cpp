#include "transfer/file_copier.hpp"
#include "transfer/checksum_verifier.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

FileCopier::FileCopier(const TransferConfig& config, CancellationToken& token,
                       ConflictResolver resolver)
    : config_(config)
    , token_(token)
    , resolver_(resolver ? std::move(resolver) : makeConflictResolver(config.conflictPolicy)) {
    if (config_.chunkSize == 0) {
        config_.chunkSize = TransferConfig().chunkSize;
    }
}

TransferResult FileCopier::copy(TransferItem& item, const ProgressCallback& onProgress) {
    const fs::path source = item.getSourcePath();
    fs::path destination = item.getDestinationPath();

    if (!token_.waitWhilePaused()) {
        return TransferResult::cancelled();
    }

    std::error_code ec;
    auto sourceStatus = fs::status(source, ec);
    if (!fs::exists(sourceStatus)) {
        return TransferResult::failure(TransferErrorCode::IOFailure,
                                       "Source does not exist: " + source.string());
    }
    if (fs::is_directory(sourceStatus)) {
        return TransferResult::failure(TransferErrorCode::IOFailure,
                                       "Source is a directory: " + source.string());
    }

    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            return TransferResult::failure(TransferErrorCode::IOFailure,
                                           "Failed to create directory " +
                                           destination.parent_path().string() + ": " + ec.message());
        }
    }

    TransferResult resolved = resolveDestination(source, destination);
    if (resolved.code == TransferErrorCode::AlreadyExists) {
        item.skip(resolved.message);
        Logger::info("Skipped " + source.string() + ": " + resolved.message);
        return resolved;
    }
    if (resolved.isFailure()) {
        return resolved;
    }
    if (destination != item.getDestinationPath()) {
        item.setDestinationPath(destination);
    }

    item.startTransfer();

    uint64_t sourceSize = fs::file_size(source, ec);
    if (ec) {
        return TransferResult::failure(TransferErrorCode::IOFailure,
                                       "Cannot read size of " + source.string() + ": " + ec.message());
    }
    item.setTotalBytes(sourceSize);

    ChunkCallback onChunk = [&item, &onProgress](uint64_t chunkBytes) {
        item.addBytes(chunkBytes);
        if (onProgress) {
            onProgress(item);
        }
    };

    uint64_t bytesCopied = 0;
    TransferResult result = copyFile(source, destination, onChunk, bytesCopied);
    if (result.isFailure()) {
        return result;
    }

    item.complete(bytesCopied);
    return TransferResult::success();
}

TransferResult FileCopier::resolveDestination(const fs::path& source, fs::path& destination) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(destination, ec))) {
        return TransferResult::success();
    }

    if (fs::equivalent(source, destination, ec)) {
        return TransferResult::failure(TransferErrorCode::IOFailure,
                                       "Source and destination are the same file: " + source.string());
    }

    switch (resolveConflict(resolver_, source, destination)) {
        case ConflictDecision::Overwrite:
            Logger::debug("Overwriting existing file " + destination.string());
            return TransferResult::success();
        case ConflictDecision::Rename: {
            try {
                destination = uniqueDestinationPath(destination);
            } catch (const std::exception& e) {
                return TransferResult::failure(TransferErrorCode::IOFailure, e.what());
            }
            Logger::debug("Destination exists, writing to " + destination.string());
            return TransferResult::success();
        }
        case ConflictDecision::Skip:
        default:
            return TransferResult::alreadyExists("File already exists");
    }
}

TransferResult FileCopier::copyFile(const fs::path& source,
                                    const fs::path& destination,
                                    const ChunkCallback& onChunk,
                                    uint64_t& bytesCopied) {
    bytesCopied = 0;
    bool destinationTouched = false;
    TransferResult result;

    try {
        result = copyContents(source, destination, onChunk, bytesCopied, destinationTouched);
        if (!result.isFailure()) {
            result = verifyCopy(source, destination);
        }
        if (!result.isFailure()) {
            std::error_code ec;
            auto perms = fs::status(source, ec).permissions();
            if (!ec) {
                fs::permissions(destination, perms, fs::perm_options::replace, ec);
            }
            if (ec) {
                result = TransferResult::failure(TransferErrorCode::IOFailure,
                                                 "Failed to copy permissions to " +
                                                 destination.string() + ": " + ec.message());
            }
        }
    } catch (const std::exception& e) {
        result = TransferResult::failure(TransferErrorCode::IOFailure, e.what());
    }

    if (result.isFailure() && destinationTouched) {
        removePartial(destination);
    }
    return result;
}

TransferResult FileCopier::copyContents(const fs::path& source,
                                        const fs::path& destination,
                                        const ChunkCallback& onChunk,
                                        uint64_t& bytesCopied,
                                        bool& destinationTouched) {
    if (!token_.waitWhilePaused()) {
        return TransferResult::cancelled();
    }

    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        return TransferResult::failure(TransferErrorCode::IOFailure,
                                       "Failed to open source file: " + source.string());
    }

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return TransferResult::failure(TransferErrorCode::IOFailure,
                                       "Failed to open destination file: " + destination.string());
    }
    destinationTouched = true;

    std::vector<char> buffer(config_.chunkSize);
    while (true) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = in.gcount();
        if (in.bad()) {
            return TransferResult::failure(TransferErrorCode::IOFailure,
                                           "Read error on " + source.string());
        }
        if (count <= 0) {
            break;
        }

        out.write(buffer.data(), count);
        if (!out) {
            return TransferResult::failure(TransferErrorCode::IOFailure,
                                           "Write error on " + destination.string());
        }

        if (!token_.waitWhilePaused()) {
            Logger::info("Copy of " + source.string() + " cancelled after " +
                         std::to_string(bytesCopied) + " bytes");
            return TransferResult::cancelled();
        }

        bytesCopied += static_cast<uint64_t>(count);
        if (onChunk) {
            onChunk(static_cast<uint64_t>(count));
        }

        if (in.eof()) {
            break;
        }
    }

    out.close();
    if (out.fail()) {
        return TransferResult::failure(TransferErrorCode::IOFailure,
                                       "Failed to flush " + destination.string());
    }
    return TransferResult::success();
}

TransferResult FileCopier::verifyCopy(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    uint64_t sourceSize = fs::file_size(source, ec);
    if (ec) {
        return TransferResult::failure(TransferErrorCode::IOFailure,
                                       "Cannot stat " + source.string() + ": " + ec.message());
    }
    uint64_t destinationSize = fs::file_size(destination, ec);
    if (ec) {
        return TransferResult::failure(TransferErrorCode::IOFailure,
                                       "Cannot stat " + destination.string() + ": " + ec.message());
    }
    if (sourceSize != destinationSize) {
        return TransferResult::failure(TransferErrorCode::SizeMismatch,
                                       "File size mismatch after copy (" + std::to_string(sourceSize) +
                                       " != " + std::to_string(destinationSize) + ")");
    }

    if (config_.verifyChecksum) {
        std::string sourceDigest = ChecksumVerifier::digest(source, config_.checksumBlockSize);
        std::string destinationDigest = ChecksumVerifier::digest(destination, config_.checksumBlockSize);
        if (sourceDigest != destinationDigest) {
            return TransferResult::failure(TransferErrorCode::ChecksumMismatch,
                                           "Checksum verification failed for " + destination.string());
        }
        Logger::debug("Checksum verified for " + destination.string() + " (" + destinationDigest + ")");
    }
    return TransferResult::success();
}

void FileCopier::removePartial(const fs::path& destination) {
    std::error_code ec;
    fs::remove(destination, ec);
    if (ec) {
        Logger::debug("Could not remove partial file " + destination.string() + ": " + ec.message());
    }
}
