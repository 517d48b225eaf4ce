#pragma once

#include "common/cancellation_token.hpp"
#include "transfer/conflict_policy.hpp"
#include "transfer/directory_copier.hpp"
#include "transfer/event_bus.hpp"
#include "transfer/file_copier.hpp"
#include "transfer/transfer_config.hpp"
#include "transfer/transfer_item.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct OverallProgress {
    size_t total{0};
    size_t completed{0};    // Includes skipped items
    size_t failed{0};
    size_t active{0};
    size_t queued{0};
    size_t skipped{0};
    uint64_t bytesTransferred{0};
    double percentComplete{0.0};
};

// Owns every transfer item and drains them in FIFO order on a small pool of
// worker threads. Callers only ever see snapshots.
class TransferQueue {
public:
    // An explicit resolver takes precedence over config.conflictPolicy
    explicit TransferQueue(const TransferConfig& config = TransferConfig(),
                           ConflictResolver resolver = nullptr);
    ~TransferQueue();

    TransferQueue(const TransferQueue&) = delete;
    TransferQueue& operator=(const TransferQueue&) = delete;

    // Queue management
    std::string enqueue(const std::filesystem::path& sourcePath,
                        const std::filesystem::path& destinationPath,
                        bool isDirectory);

    // Worker control
    void start();
    bool stop();
    void pause();
    void resume();
    bool isPaused() const;
    bool isRunning() const;
    bool waitForCompletion(std::chrono::milliseconds timeout);

    // Status queries
    std::optional<TransferSnapshot> statusOf(const std::string& id) const;
    OverallProgress overallProgress() const;
    std::vector<TransferSnapshot> snapshots() const;

    // Observers. Handlers run on worker threads; a stop() from a handler
    // cancels without waiting and returns false.
    EventBus& events() { return events_; }
    void subscribe(TransferEvent event, EventBus::SnapshotHandler handler);

    const TransferConfig& getConfig() const { return config_; }

private:
    void workerThread();
    void processItem(TransferItem& item);
    void publishProgress(const TransferItem& item);
    void updateActive(const TransferItem& item);
    bool isWorkerThread() const;

    TransferConfig config_;
    CancellationToken token_;
    EventBus events_;
    FileCopier fileCopier_;
    DirectoryCopier directoryCopier_;

    mutable std::mutex mutex_;
    std::condition_variable idleCondition_;
    std::deque<TransferItem> pending_;
    std::unordered_map<std::string, TransferSnapshot> active_;
    std::vector<TransferItem> completed_;
    std::vector<TransferItem> failed_;
    std::vector<std::thread> workers_;
    size_t runningWorkers_{0};
};
