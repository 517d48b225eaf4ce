#include "transfer/transfer_item.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:      return "pending";
        case TransferStatus::Transferring: return "transferring";
        case TransferStatus::Completed:    return "completed";
        case TransferStatus::Failed:       return "failed";
        case TransferStatus::Skipped:      return "skipped";
        default:                           return "unknown";
    }
}

bool isTerminal(TransferStatus status) {
    return status == TransferStatus::Completed ||
           status == TransferStatus::Failed ||
           status == TransferStatus::Skipped;
}

TransferItem::TransferItem(std::string id,
                           std::filesystem::path sourcePath,
                           std::filesystem::path destinationPath,
                           bool isDirectory)
    : id_(std::move(id))
    , sourcePath_(std::move(sourcePath))
    , destinationPath_(std::move(destinationPath))
    , isDirectory_(isDirectory) {
}

std::string TransferItem::generateId() {
    static std::atomic<uint64_t> sequence{0};

    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count() << '-' << sequence.fetch_add(1) << '-';
    for (int i = 0; i < 6; ++i) {
        ss << hex[dis(gen)];
    }

    return ss.str();
}

bool TransferItem::transitionTo(TransferStatus next) {
    bool allowed = false;
    switch (status_) {
        case TransferStatus::Pending:
            allowed = next == TransferStatus::Transferring ||
                      next == TransferStatus::Skipped ||
                      next == TransferStatus::Failed;
            break;
        case TransferStatus::Transferring:
            allowed = isTerminal(next);
            break;
        default:
            allowed = false;
            break;
    }

    if (!allowed) {
        Logger::warning("Transfer " + id_ + ": rejected transition " +
                        toString(status_) + " -> " + toString(next));
        return false;
    }

    status_ = next;
    return true;
}

bool TransferItem::startTransfer() {
    if (!transitionTo(TransferStatus::Transferring)) {
        return false;
    }
    startedAt_ = std::chrono::system_clock::now();
    return true;
}

bool TransferItem::complete() {
    if (!transitionTo(TransferStatus::Completed)) {
        return false;
    }
    finishedAt_ = std::chrono::system_clock::now();
    return true;
}

bool TransferItem::complete(uint64_t bytesTransferred) {
    if (!complete()) {
        return false;
    }
    bytesTransferred_ = bytesTransferred;
    totalBytes_ = std::max(totalBytes_, bytesTransferred);
    return true;
}

bool TransferItem::fail(const std::string& reason) {
    if (!transitionTo(TransferStatus::Failed)) {
        return false;
    }
    error_ = reason.empty() ? "Unknown error" : reason;
    finishedAt_ = std::chrono::system_clock::now();
    return true;
}

bool TransferItem::skip(const std::string& reason) {
    if (!transitionTo(TransferStatus::Skipped)) {
        return false;
    }
    error_ = reason.empty() ? "Skipped" : reason;
    finishedAt_ = std::chrono::system_clock::now();
    return true;
}

void TransferItem::setTotalBytes(uint64_t totalBytes) {
    totalBytes_ = std::max(totalBytes, bytesTransferred_);
}

void TransferItem::addBytes(uint64_t bytes) {
    bytesTransferred_ += bytes;
    if (bytesTransferred_ > totalBytes_) {
        totalBytes_ = bytesTransferred_;
    }
}

double TransferItem::duration() const {
    if (!startedAt_ || !finishedAt_) {
        return 0.0;
    }
    std::chrono::duration<double> elapsed = *finishedAt_ - *startedAt_;
    return std::max(0.0, elapsed.count());
}

double TransferItem::speed() const {
    double seconds = duration();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytesTransferred_) / seconds;
}

double TransferItem::progressFraction() const {
    if (totalBytes_ == 0) {
        return status_ == TransferStatus::Completed ? 1.0 : 0.0;
    }
    double fraction = static_cast<double>(bytesTransferred_) / static_cast<double>(totalBytes_);
    return std::min(1.0, std::max(0.0, fraction));
}

TransferSnapshot TransferItem::snapshot() const {
    TransferSnapshot snap;
    snap.id = id_;
    snap.source = sourcePath_.string();
    snap.destination = destinationPath_.string();
    snap.isDirectory = isDirectory_;
    snap.status = status_;
    snap.bytesTransferred = bytesTransferred_;
    snap.totalBytes = totalBytes_;
    snap.progressFraction = progressFraction();
    snap.speed = speed();
    snap.duration = duration();
    snap.error = error_;
    snap.startedAt = startedAt_;
    snap.finishedAt = finishedAt_;
    snap.filesTransferred = filesTransferred_;
    snap.filesSkipped = filesSkipped_;
    snap.filesFailed = filesFailed_;
    return snap;
}
