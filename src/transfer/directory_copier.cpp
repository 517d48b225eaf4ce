#include "transfer/directory_copier.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

bool byFileName(const fs::path& a, const fs::path& b) {
    return a.filename() < b.filename();
}

// True when path is root itself or lies below it; both must be canonical
bool isWithin(const fs::path& path, const fs::path& root) {
    auto pathIt = path.begin();
    for (auto rootIt = root.begin(); rootIt != root.end(); ++rootIt, ++pathIt) {
        if (pathIt == path.end() || *pathIt != *rootIt) {
            return false;
        }
    }
    return true;
}

} // namespace

DirectoryCopier::DirectoryCopier(const TransferConfig& config, CancellationToken& token,
                                 ConflictResolver resolver)
    : config_(config)
    , token_(token)
    , fileCopier_(config, token, std::move(resolver)) {
}

TransferResult DirectoryCopier::copy(TransferItem& item, const ProgressCallback& onProgress) {
    const fs::path source = item.getSourcePath();
    const fs::path destination = item.getDestinationPath();

    if (!token_.waitWhilePaused()) {
        return TransferResult::cancelled();
    }

    std::error_code ec;
    if (!fs::is_directory(fs::status(source, ec))) {
        return TransferResult::failure(TransferErrorCode::IOFailure,
                                       "Source is not a directory: " + source.string());
    }

    // Mirroring into the source tree would walk its own output
    const fs::path canonicalSource = fs::weakly_canonical(source, ec);
    if (!ec) {
        const fs::path canonicalDestination = fs::weakly_canonical(destination, ec);
        if (!ec && isWithin(canonicalDestination, canonicalSource)) {
            return TransferResult::failure(TransferErrorCode::IOFailure,
                                           "Destination " + destination.string() +
                                           " lies inside source " + source.string());
        }
    }

    const bool rootExisted = fs::exists(fs::symlink_status(destination, ec));
    if (rootExisted) {
        if (!fs::is_directory(fs::status(destination, ec))) {
            return TransferResult::failure(TransferErrorCode::IOFailure,
                                           "Destination exists and is not a directory: " +
                                           destination.string());
        }
    } else {
        fs::create_directories(destination, ec);
        if (ec) {
            return TransferResult::failure(TransferErrorCode::IOFailure,
                                           "Failed to create directory " + destination.string() +
                                           ": " + ec.message());
        }
    }

    item.startTransfer();
    item.setTotalBytes(measureTree(source));
    Logger::info("Copying directory " + source.string() + " -> " + destination.string() +
                 " (" + std::to_string(item.getTotalBytes()) + " bytes)");

    WalkState state{item, onProgress, {}};
    TransferResult result;
    try {
        result = copyLevel(source, destination, state, true);
    } catch (const std::exception& e) {
        result = TransferResult::failure(TransferErrorCode::IOFailure, e.what());
    }

    if (result.isFailure()) {
        rollback(destination, rootExisted, state.created);
        return result;
    }

    item.complete();
    TransferSnapshot done = item.snapshot();
    Logger::info("Directory " + source.string() + " done: " +
                 std::to_string(done.filesTransferred) + " copied, " +
                 std::to_string(done.filesSkipped) + " skipped, " +
                 std::to_string(done.filesFailed) + " failed");
    return TransferResult::success();
}

TransferResult DirectoryCopier::copyLevel(const fs::path& sourceDir,
                                          const fs::path& destinationDir,
                                          WalkState& state,
                                          bool isRoot) {
    if (!token_.waitWhilePaused()) {
        return TransferResult::cancelled();
    }

    std::vector<fs::path> files;
    std::vector<fs::path> directories;

    std::error_code ec;
    fs::directory_iterator it(sourceDir, ec);
    const fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const fs::path entryPath = it->path();
        std::error_code statusEc;
        auto linkStatus = it->symlink_status(statusEc);

        if (fs::is_symlink(linkStatus)) {
            if (fs::is_directory(fs::status(entryPath, statusEc))) {
                Logger::debug("Not following directory link " + entryPath.string());
                continue;
            }
            files.push_back(entryPath);
        } else if (fs::is_directory(linkStatus)) {
            directories.push_back(entryPath);
        } else if (fs::is_regular_file(linkStatus)) {
            files.push_back(entryPath);
        } else {
            Logger::debug("Skipping special file " + entryPath.string());
        }
    }

    if (ec) {
        std::string message = "Failed to list directory " + sourceDir.string() + ": " + ec.message();
        if (isRoot) {
            return TransferResult::failure(TransferErrorCode::IOFailure, message);
        }
        Logger::warning(message);
        state.item.recordFileFailed();
        return TransferResult::success();
    }

    std::sort(files.begin(), files.end(), byFileName);
    std::sort(directories.begin(), directories.end(), byFileName);

    for (const auto& file : files) {
        if (!token_.waitWhilePaused()) {
            return TransferResult::cancelled();
        }
        TransferResult result = copyEntry(file, destinationDir / file.filename(), state);
        if (result.isFailure()) {
            return result;
        }
    }

    for (const auto& directory : directories) {
        const fs::path target = destinationDir / directory.filename();

        std::error_code dirEc;
        auto targetStatus = fs::symlink_status(target, dirEc);
        if (!fs::exists(targetStatus)) {
            fs::create_directory(target, dirEc);
            if (dirEc) {
                Logger::warning("Failed to create directory " + target.string() + ": " + dirEc.message());
                continue;
            }
            state.created.push_back(target);
        } else if (!fs::is_directory(fs::status(target, dirEc))) {
            Logger::warning("Cannot mirror " + directory.string() + ": " +
                            target.string() + " exists and is not a directory");
            continue;
        }

        TransferResult result = copyLevel(directory, target, state, false);
        if (result.isFailure()) {
            return result;
        }
    }

    return TransferResult::success();
}

TransferResult DirectoryCopier::copyEntry(const fs::path& sourceFile,
                                          const fs::path& destinationFile,
                                          WalkState& state) {
    fs::path target = destinationFile;
    TransferResult resolved = fileCopier_.resolveDestination(sourceFile, target);
    if (resolved.code == TransferErrorCode::AlreadyExists) {
        state.item.recordFileSkipped();
        return TransferResult::success();
    }
    if (resolved.isFailure()) {
        Logger::warning("Failed to copy " + sourceFile.string() + ": " + resolved.message);
        state.item.recordFileFailed();
        return TransferResult::success();
    }

    std::error_code ec;
    const bool existedBefore = fs::exists(fs::symlink_status(target, ec));

    uint64_t bytesCopied = 0;
    TransferResult result = fileCopier_.copyFile(sourceFile, target, nullptr, bytesCopied);
    if (result.isCancelled()) {
        return result;
    }
    if (result.isFailure()) {
        Logger::warning("Failed to copy " + sourceFile.string() + ": " + result.message);
        state.item.recordFileFailed();
        return TransferResult::success();
    }

    if (!existedBefore) {
        state.created.push_back(target);
    }

    if (config_.preserveTimestamps) {
        auto modified = fs::last_write_time(sourceFile, ec);
        if (!ec) {
            fs::last_write_time(target, modified, ec);
        }
        if (ec) {
            Logger::debug("Could not carry modification time to " + target.string() + ": " + ec.message());
        }
    }

    state.item.addBytes(bytesCopied);
    state.item.recordFileTransferred();
    if (state.onProgress) {
        state.onProgress(state.item);
    }
    return TransferResult::success();
}

void DirectoryCopier::rollback(const fs::path& root, bool rootExisted,
                               const std::vector<fs::path>& created) {
    std::error_code ec;
    if (!rootExisted) {
        fs::remove_all(root, ec);
        if (ec) {
            Logger::warning("Failed to remove " + root.string() + ": " + ec.message());
        }
        return;
    }

    for (auto it = created.rbegin(); it != created.rend(); ++it) {
        fs::remove_all(*it, ec);
        if (ec) {
            Logger::warning("Failed to remove " + it->string() + ": " + ec.message());
        }
    }
}

uint64_t DirectoryCopier::measureTree(const fs::path& root) {
    uint64_t total = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (it->is_regular_file(entryEc)) {
            uint64_t size = it->file_size(entryEc);
            if (!entryEc) {
                total += size;
            }
        }
    }
    return total;
}
