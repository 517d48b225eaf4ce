#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

// Shared stop/pause signal checked by workers at their checkpoints.
// Paused workers block on a condition variable until resume() or cancel().
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    void pause();
    void resume();
    bool isPaused() const { return paused_.load(std::memory_order_acquire); }

    // Clears cancellation so the owner can run again; pause state is kept
    void reset();

    // Blocks while paused. Returns false once cancelled, true otherwise.
    bool waitWhilePaused();

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> paused_{false};
    std::mutex mutex_;
    std::condition_variable condition_;
};
