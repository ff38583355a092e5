#pragma once

#include "nav/navigation_event.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace wg::service {

/// Multi-producer, single-consumer FIFO of navigation events.
/// The consumer calls task_done() after handling each popped event so that
/// wait_drained() can tell when everything pushed so far has been consumed.
class EventQueue : public nav::EventSink {
public:
    void push(nav::NavigationEvent event) override;

    /// Wait up to `timeout` for an event. Empty on timeout or when closed
    /// and drained.
    std::optional<nav::NavigationEvent> pop_for(std::chrono::milliseconds timeout);

    void task_done();

    /// Block until every pushed event has been popped and marked done.
    bool wait_drained(std::chrono::milliseconds timeout);

    /// Reject further pushes and wake the consumer.
    void close();
    bool closed() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::condition_variable drained_;
    std::deque<nav::NavigationEvent> events_;
    size_t unfinished_ = 0;
    bool closed_ = false;
};

} // namespace wg::service
