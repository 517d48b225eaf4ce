#include "transfer/transfer_queue.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <utility>

TransferQueue::TransferQueue(const TransferConfig& config, ConflictResolver resolver)
    : config_(config)
    , fileCopier_(config, token_, resolver)
    , directoryCopier_(config, token_, resolver) {
    if (config_.workerCount == 0) {
        config_.workerCount = 1;
    }
}

TransferQueue::~TransferQueue() {
    token_.cancel();

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& thread : workers) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::string TransferQueue::enqueue(const std::filesystem::path& sourcePath,
                                   const std::filesystem::path& destinationPath,
                                   bool isDirectory) {
    std::string id = TransferItem::generateId();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.emplace_back(id, sourcePath, destinationPath, isDirectory);
    }
    Logger::debug("Queued transfer " + id + ": " + sourcePath.string() + " -> " +
                  destinationPath.string() + (isDirectory ? " (directory)" : ""));
    return id;
}

void TransferQueue::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (runningWorkers_ > 0) {
        return;
    }

    // Workers from a previous run have all returned; reap them
    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workers_.clear();
    token_.reset();

    Logger::info("Starting " + std::to_string(config_.workerCount) + " transfer worker(s), " +
                 std::to_string(pending_.size()) + " item(s) queued");

    runningWorkers_ = config_.workerCount;
    workers_.reserve(config_.workerCount);
    for (size_t i = 0; i < config_.workerCount; ++i) {
        workers_.emplace_back(&TransferQueue::workerThread, this);
    }
}

bool TransferQueue::stop() {
    token_.cancel();

    if (isWorkerThread()) {
        Logger::warning("stop() called from a transfer worker, not waiting for it to exit");
        return false;
    }

    std::vector<std::thread> finished;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool exited = idleCondition_.wait_for(lock, config_.stopTimeout, [this] {
            return runningWorkers_ == 0;
        });
        if (!exited) {
            Logger::warning("Transfer workers did not stop within " +
                            std::to_string(config_.stopTimeout.count()) + " ms");
            return false;
        }
        finished.swap(workers_);
    }

    for (auto& thread : finished) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    Logger::info("Transfer queue stopped");
    return true;
}

void TransferQueue::pause() {
    token_.pause();
    Logger::info("Transfer queue paused");
}

void TransferQueue::resume() {
    token_.resume();
    Logger::info("Transfer queue resumed");
}

bool TransferQueue::isPaused() const {
    return token_.isPaused();
}

bool TransferQueue::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runningWorkers_ > 0;
}

bool TransferQueue::waitForCompletion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCondition_.wait_for(lock, timeout, [this] {
        return runningWorkers_ == 0;
    });
}

void TransferQueue::subscribe(TransferEvent event, EventBus::SnapshotHandler handler) {
    events_.subscribe(event, std::move(handler));
}

std::optional<TransferSnapshot> TransferQueue::statusOf(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto activeIt = active_.find(id);
    if (activeIt != active_.end()) {
        return activeIt->second;
    }

    auto matches = [&id](const TransferItem& item) { return item.getId() == id; };

    auto pendingIt = std::find_if(pending_.begin(), pending_.end(), matches);
    if (pendingIt != pending_.end()) {
        return pendingIt->snapshot();
    }
    auto completedIt = std::find_if(completed_.begin(), completed_.end(), matches);
    if (completedIt != completed_.end()) {
        return completedIt->snapshot();
    }
    auto failedIt = std::find_if(failed_.begin(), failed_.end(), matches);
    if (failedIt != failed_.end()) {
        return failedIt->snapshot();
    }
    return std::nullopt;
}

OverallProgress TransferQueue::overallProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);

    OverallProgress progress;
    progress.queued = pending_.size();
    progress.active = active_.size();
    progress.completed = completed_.size();
    progress.failed = failed_.size();
    progress.total = progress.queued + progress.active + progress.completed + progress.failed;

    for (const auto& entry : active_) {
        progress.bytesTransferred += entry.second.bytesTransferred;
    }
    for (const auto& item : completed_) {
        progress.bytesTransferred += item.getBytesTransferred();
        if (item.getStatus() == TransferStatus::Skipped) {
            ++progress.skipped;
        }
    }
    for (const auto& item : failed_) {
        progress.bytesTransferred += item.getBytesTransferred();
    }

    if (progress.total > 0) {
        progress.percentComplete = static_cast<double>(progress.completed) /
                                   static_cast<double>(progress.total) * 100.0;
    }
    return progress;
}

std::vector<TransferSnapshot> TransferQueue::snapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TransferSnapshot> result;
    result.reserve(pending_.size() + active_.size() + completed_.size() + failed_.size());
    for (const auto& item : pending_) {
        result.push_back(item.snapshot());
    }
    for (const auto& entry : active_) {
        result.push_back(entry.second);
    }
    for (const auto& item : completed_) {
        result.push_back(item.snapshot());
    }
    for (const auto& item : failed_) {
        result.push_back(item.snapshot());
    }
    return result;
}

void TransferQueue::workerThread() {
    Logger::debug("Transfer worker started");

    while (token_.waitWhilePaused()) {
        TransferItem item;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.empty() || token_.isCancelled()) {
                break;
            }
            item = std::move(pending_.front());
            pending_.pop_front();
            active_[item.getId()] = item.snapshot();
        }
        processItem(item);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        --runningWorkers_;
    }
    idleCondition_.notify_all();
    Logger::debug("Transfer worker exiting");
}

void TransferQueue::processItem(TransferItem& item) {
    const std::string id = item.getId();
    Logger::info("Starting transfer " + id + ": " + item.getSourcePath().string() +
                 " -> " + item.getDestinationPath().string());

    events_.start.publish(item.snapshot());

    auto onProgress = [this](const TransferItem& current) {
        publishProgress(current);
    };

    TransferResult result;
    try {
        if (item.isDirectory()) {
            result = directoryCopier_.copy(item, onProgress);
        } else {
            result = fileCopier_.copy(item, onProgress);
        }
    } catch (const std::exception& e) {
        result = TransferResult::failure(TransferErrorCode::IOFailure, e.what());
    }

    if (result.isFailure()) {
        item.fail(result.message);
    } else if (!item.isFinished()) {
        item.fail("Transfer ended without reaching a final state");
    }
    updateActive(item);

    TransferSnapshot finalSnapshot = item.snapshot();
    if (result.isCancelled()) {
        Logger::info("Transfer " + id + " cancelled");
        events_.cancel.publish(finalSnapshot);
    } else if (item.getStatus() == TransferStatus::Failed) {
        Logger::error("Transfer " + id + " failed (" + toString(result.code) + "): " +
                      finalSnapshot.error);
        events_.error.publish(finalSnapshot, finalSnapshot.error);
    } else {
        Logger::info("Transfer " + id + " " + toString(finalSnapshot.status) + ", " +
                     std::to_string(finalSnapshot.bytesTransferred) + " bytes");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(id);
        if (item.getStatus() == TransferStatus::Failed) {
            failed_.push_back(std::move(item));
        } else {
            completed_.push_back(std::move(item));
        }
    }

    events_.complete.publish(finalSnapshot);
}

void TransferQueue::publishProgress(const TransferItem& item) {
    TransferSnapshot snapshot = item.snapshot();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_[snapshot.id] = snapshot;
    }
    events_.progress.publish(snapshot);
}

void TransferQueue::updateActive(const TransferItem& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_[item.getId()] = item.snapshot();
}

bool TransferQueue::isWorkerThread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto self = std::this_thread::get_id();
    return std::any_of(workers_.begin(), workers_.end(),
                       [&self](const std::thread& thread) { return thread.get_id() == self; });
}
