#include "onionchat/events.hpp"

#include <iterator>
#include <utility>

namespace OnionChat {

const std::string& event_address(const Event& event) {
    return std::visit([](const auto& e) -> const std::string& { return e.address; }, event);
}

void EventQueue::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void EventQueue::push_all(std::vector<Event> events) {
    if (events.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& event : events) {
            events_.push_back(std::move(event));
        }
    }
    cv_.notify_all();
}

std::optional<Event> EventQueue::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<Event> EventQueue::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<Event> EventQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> out(std::make_move_iterator(events_.begin()), std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace OnionChat
