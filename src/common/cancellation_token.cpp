#include "common/cancellation_token.hpp"

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    condition_.notify_all();
}

void CancellationToken::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_.store(true, std::memory_order_release);
}

void CancellationToken::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_.store(false, std::memory_order_release);
    }
    condition_.notify_all();
}

void CancellationToken::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(false, std::memory_order_release);
}

bool CancellationToken::waitWhilePaused() {
    if (!isPaused()) {
        return !isCancelled();
    }

    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] {
        return !paused_.load(std::memory_order_acquire) ||
               cancelled_.load(std::memory_order_acquire);
    });
    return !cancelled_.load(std::memory_order_acquire);
}
