#pragma once

#include "common/cancellation_token.hpp"
#include "transfer/conflict_policy.hpp"
#include "transfer/transfer_config.hpp"
#include "transfer/transfer_item.hpp"
#include "transfer/transfer_result.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>

class FileCopier {
public:
    using ProgressCallback = std::function<void(const TransferItem&)>;
    using ChunkCallback = std::function<void(uint64_t chunkBytes)>;

    // Without an explicit resolver, config.conflictPolicy decides conflicts
    FileCopier(const TransferConfig& config, CancellationToken& token,
               ConflictResolver resolver = nullptr);

    // Copies a single-file item, driving it through its states. On failure
    // the item is left for the caller to mark failed.
    TransferResult copy(TransferItem& item, const ProgressCallback& onProgress = nullptr);

    // Chunked copy of one file followed by size/checksum verification and
    // permission propagation. A partially written destination is removed
    // on any failure.
    TransferResult copyFile(const std::filesystem::path& source,
                            const std::filesystem::path& destination,
                            const ChunkCallback& onChunk,
                            uint64_t& bytesCopied);

    // Applies the conflict resolver when destination exists. Returns
    // AlreadyExists for a skip; destination is updated for a rename.
    TransferResult resolveDestination(const std::filesystem::path& source,
                                      std::filesystem::path& destination);

    const TransferConfig& getConfig() const { return config_; }

private:
    TransferResult copyContents(const std::filesystem::path& source,
                                const std::filesystem::path& destination,
                                const ChunkCallback& onChunk,
                                uint64_t& bytesCopied,
                                bool& destinationTouched);
    TransferResult verifyCopy(const std::filesystem::path& source,
                              const std::filesystem::path& destination);
    void removePartial(const std::filesystem::path& destination);

    TransferConfig config_;
    CancellationToken& token_;
    ConflictResolver resolver_;
};
