#pragma once

#include "common/cancellation_token.hpp"
#include "transfer/file_copier.hpp"
#include "transfer/transfer_config.hpp"
#include "transfer/transfer_item.hpp"
#include "transfer/transfer_result.hpp"
#include <cstdint>
#include <filesystem>
#include <vector>

// Mirrors a directory tree file by file. Failures of individual files are
// logged and counted on the item; only cancellation and errors at the root
// fail the item, and those roll back what this item created.
class DirectoryCopier {
public:
    using ProgressCallback = FileCopier::ProgressCallback;

    DirectoryCopier(const TransferConfig& config, CancellationToken& token,
                    ConflictResolver resolver = nullptr);

    TransferResult copy(TransferItem& item, const ProgressCallback& onProgress = nullptr);

    // Sum of regular file sizes below root; unreadable entries count as 0
    static uint64_t measureTree(const std::filesystem::path& root);

private:
    struct WalkState {
        TransferItem& item;
        const ProgressCallback& onProgress;
        std::vector<std::filesystem::path> created;
    };

    TransferResult copyLevel(const std::filesystem::path& sourceDir,
                             const std::filesystem::path& destinationDir,
                             WalkState& state,
                             bool isRoot);
    TransferResult copyEntry(const std::filesystem::path& sourceFile,
                             const std::filesystem::path& destinationFile,
                             WalkState& state);
    void rollback(const std::filesystem::path& root, bool rootExisted,
                  const std::vector<std::filesystem::path>& created);

    TransferConfig config_;
    CancellationToken& token_;
    FileCopier fileCopier_;
};
