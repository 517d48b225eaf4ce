#pragma once

#include "common/event_channel.hpp"
#include "transfer/transfer_item.hpp"
#include <functional>
#include <optional>
#include <string>

enum class TransferEvent {
    Start,
    Progress,
    Complete,
    Error,
    Cancel
};

std::string toString(TransferEvent event);
std::optional<TransferEvent> transferEventFromString(const std::string& name);

// Lifecycle notifications for queued transfers, one typed channel per event
class EventBus {
public:
    using SnapshotHandler = std::function<void(const TransferSnapshot&)>;
    using ErrorHandler = std::function<void(const TransferSnapshot&, const std::string&)>;

    EventChannel<const TransferSnapshot&> start{"start"};
    EventChannel<const TransferSnapshot&> progress{"progress"};
    EventChannel<const TransferSnapshot&> complete{"complete"};
    EventChannel<const TransferSnapshot&, const std::string&> error{"error"};
    EventChannel<const TransferSnapshot&> cancel{"cancel"};

    // Subscribes by event name; error handlers find the message in snapshot.error
    void subscribe(TransferEvent event, SnapshotHandler handler);
};
