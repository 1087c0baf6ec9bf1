#include "kernel/services/event_channel.hpp"

namespace nb {

const char* to_string(StreamEvent::Kind kind) noexcept {
    switch (kind) {
        case StreamEvent::Progress: return "progress";
        case StreamEvent::Error: return "error";
        case StreamEvent::End: return "end";
    }
    return "progress";
}

int EventChannel::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    int id = next_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

bool EventChannel::unsubscribe(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.erase(id) != 0;
}

void EventChannel::publish(const StreamEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffering_) buffer_.push_back(event);
    for (auto& kv : listeners_) {
        try {
            kv.second(event);
        } catch (const std::exception&) {
            ++listener_failures_;
        }
    }
}

void EventChannel::set_buffering(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffering_ = enabled;
    if (!enabled) buffer_.clear();
}

std::vector<StreamEvent> EventChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StreamEvent> out;
    out.swap(buffer_);
    return out;
}

int EventChannel::listener_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listener_failures_;
}

} // namespace nb
