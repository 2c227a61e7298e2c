#include "ipcam_player/stream_event_bus.hpp"

#include <utility>

namespace ipcam_player {

void StreamEventBus::publish(StreamEvent event) {
    std::scoped_lock lock(mutex_);
    if (event.type == StreamEventType::FrameReady && !queue_events_.empty()) {
        StreamEvent& newest = queue_events_.back();
        if (newest.type == StreamEventType::FrameReady && newest.generation == event.generation) {
            newest = std::move(event);
            return;
        }
    }
    queue_events_.push(std::move(event));
}

std::optional<StreamEvent> StreamEventBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    StreamEvent event = std::move(queue_events_.front());
    queue_events_.pop();
    return event;
}

std::size_t StreamEventBus::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

}  // namespace ipcam_player
