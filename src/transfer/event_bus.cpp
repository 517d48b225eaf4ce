#include "transfer/event_bus.hpp"
#include <utility>

std::string toString(TransferEvent event) {
    switch (event) {
        case TransferEvent::Start:    return "start";
        case TransferEvent::Progress: return "progress";
        case TransferEvent::Complete: return "complete";
        case TransferEvent::Error:    return "error";
        case TransferEvent::Cancel:   return "cancel";
        default:                      return "unknown";
    }
}

std::optional<TransferEvent> transferEventFromString(const std::string& name) {
    if (name == "start") return TransferEvent::Start;
    if (name == "progress") return TransferEvent::Progress;
    if (name == "complete") return TransferEvent::Complete;
    if (name == "error") return TransferEvent::Error;
    if (name == "cancel") return TransferEvent::Cancel;
    return std::nullopt;
}

void EventBus::subscribe(TransferEvent event, SnapshotHandler handler) {
    if (!handler) {
        return;
    }

    switch (event) {
        case TransferEvent::Start:
            start.subscribe(std::move(handler));
            break;
        case TransferEvent::Progress:
            progress.subscribe(std::move(handler));
            break;
        case TransferEvent::Complete:
            complete.subscribe(std::move(handler));
            break;
        case TransferEvent::Error:
            error.subscribe([handler = std::move(handler)](const TransferSnapshot& snapshot,
                                                           const std::string& message) {
                if (snapshot.error == message) {
                    handler(snapshot);
                    return;
                }
                TransferSnapshot withMessage = snapshot;
                withMessage.error = message;
                handler(withMessage);
            });
            break;
        case TransferEvent::Cancel:
            cancel.subscribe(std::move(handler));
            break;
    }
}
