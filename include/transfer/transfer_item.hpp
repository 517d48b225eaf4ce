#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

enum class TransferStatus {
    Pending,
    Transferring,
    Completed,
    Failed,
    Skipped
};

std::string toString(TransferStatus status);
bool isTerminal(TransferStatus status);

using TimePoint = std::chrono::system_clock::time_point;

// Copy of an item's state handed to callers and observers
struct TransferSnapshot {
    std::string id;
    std::string source;
    std::string destination;
    bool isDirectory{false};
    TransferStatus status{TransferStatus::Pending};
    uint64_t bytesTransferred{0};
    uint64_t totalBytes{0};
    double progressFraction{0.0};
    double speed{0.0};
    double duration{0.0};
    std::string error;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> finishedAt;
    uint64_t filesTransferred{0};
    uint64_t filesSkipped{0};
    uint64_t filesFailed{0};
};

// One source -> destination unit of work. Owned by the transfer queue and
// mutated by exactly one worker while in flight, so it carries no lock.
class TransferItem {
public:
    TransferItem() = default;
    TransferItem(std::string id,
                 std::filesystem::path sourcePath,
                 std::filesystem::path destinationPath,
                 bool isDirectory);

    static std::string generateId();

    const std::string& getId() const { return id_; }
    const std::filesystem::path& getSourcePath() const { return sourcePath_; }
    const std::filesystem::path& getDestinationPath() const { return destinationPath_; }
    bool isDirectory() const { return isDirectory_; }
    TransferStatus getStatus() const { return status_; }
    uint64_t getBytesTransferred() const { return bytesTransferred_; }
    uint64_t getTotalBytes() const { return totalBytes_; }
    const std::string& getError() const { return error_; }
    const std::optional<TimePoint>& getStartedAt() const { return startedAt_; }
    const std::optional<TimePoint>& getFinishedAt() const { return finishedAt_; }
    bool isFinished() const { return isTerminal(status_); }

    // State transitions. Each returns false and leaves the item untouched
    // when the move is not allowed from the current state.
    bool startTransfer();
    bool complete();
    bool complete(uint64_t bytesTransferred);
    bool fail(const std::string& reason);
    bool skip(const std::string& reason);

    // Progress, only meaningful while transferring
    void setTotalBytes(uint64_t totalBytes);
    void addBytes(uint64_t bytes);
    void setDestinationPath(const std::filesystem::path& destination) { destinationPath_ = destination; }

    void recordFileTransferred() { ++filesTransferred_; }
    void recordFileSkipped() { ++filesSkipped_; }
    void recordFileFailed() { ++filesFailed_; }

    // Seconds between start and finish, 0 while unset
    double duration() const;
    // Bytes per second, 0 when the duration is 0 or unset
    double speed() const;
    double progressFraction() const;

    TransferSnapshot snapshot() const;

private:
    bool transitionTo(TransferStatus next);

    std::string id_;
    std::filesystem::path sourcePath_;
    std::filesystem::path destinationPath_;
    bool isDirectory_{false};
    TransferStatus status_{TransferStatus::Pending};
    uint64_t bytesTransferred_{0};
    uint64_t totalBytes_{0};
    std::string error_;
    std::optional<TimePoint> startedAt_;
    std::optional<TimePoint> finishedAt_;
    uint64_t filesTransferred_{0};
    uint64_t filesSkipped_{0};
    uint64_t filesFailed_{0};
};
