#pragma once

#include "common/logger.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// One named channel of observers. Handlers run in subscription order on the
// publishing thread; a handler that throws is logged and skipped.
template<typename... Args>
class EventChannel {
public:
    using Handler = std::function<void(Args...)>;

    explicit EventChannel(std::string name) : name_(std::move(name)) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void subscribe(Handler handler) {
        if (!handler) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.push_back(std::move(handler));
    }

    void publish(Args... args) const {
        // Copy out so handlers may subscribe or publish without deadlocking
        std::vector<Handler> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers = handlers_;
        }

        for (const auto& handler : handlers) {
            try {
                handler(args...);
            } catch (const std::exception& e) {
                Logger::error("Error in " + name_ + " handler: " + e.what());
            } catch (...) {
                Logger::error("Error in " + name_ + " handler: unknown exception");
            }
        }
    }

    size_t handlerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::vector<Handler> handlers_;
    mutable std::mutex mutex_;
};
