#include "service/event_queue.hpp"

#include <spdlog/spdlog.h>

namespace wg::service {

void EventQueue::push(nav::NavigationEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            spdlog::debug("EventQueue: {} dropped after close",
                          nav::event_name(event));
            return;
        }
        events_.push_back(std::move(event));
        unfinished_++;
    }
    available_.notify_one();
}

std::optional<nav::NavigationEvent> EventQueue::pop_for(
    std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait_for(lock, timeout,
                        [this] { return !events_.empty() || closed_; });
    if (events_.empty()) return std::nullopt;

    nav::NavigationEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void EventQueue::task_done() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unfinished_ > 0) unfinished_--;
    if (unfinished_ == 0) drained_.notify_all();
}

bool EventQueue::wait_drained(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_.wait_for(lock, timeout, [this] { return unfinished_ == 0; });
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace wg::service
