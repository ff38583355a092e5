#pragma once

#include "core/types.hpp"
#include "nav/event_router.hpp"
#include "nav/guidance.hpp"
#include "nav/session.hpp"
#include "nav/settings.hpp"
#include "service/event_queue.hpp"
#include "service/speech_queue.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

namespace wg::nav {
class WaypointGraph;
}

namespace wg::service {

/// Owns one user's trip: the router that producers report into, the event
/// queue, the consumer thread that drives the session, the idle timer and
/// the speech queue. Monitoring reads snapshot(), never the session itself.
class NavigationService {
public:
    NavigationService(std::shared_ptr<const nav::WaypointGraph> graph,
                      nav::VoiceOutput& voice,
                      const nav::NavSettings& settings);
    ~NavigationService();

    NavigationService(const NavigationService&) = delete;
    NavigationService& operator=(const NavigationService&) = delete;

    void start();

    /// Drain pending events and speech, then join the worker threads.
    void stop();

    bool running() const { return running_.load(); }

    /// Entry point for all sensor and command adapters.
    nav::EventRouter& router() { return router_; }

    /// Fire-and-forget voice channel shared with the adapters.
    nav::VoiceOutput& voice() { return speech_; }

    const nav::WaypointGraph& graph() const { return *graph_; }

    nav::SessionSnapshot snapshot() const;
    nav::RouterStats router_stats() const { return router_.stats(); }
    u64 processed_count() const { return processed_.load(); }

    /// Block until every event reported so far has been handled.
    bool wait_idle(std::chrono::milliseconds timeout);

private:
    void run();
    void publish_snapshot();

    static constexpr std::chrono::milliseconds POLL_INTERVAL{100};

    std::shared_ptr<const nav::WaypointGraph> graph_;
    nav::NavSettings settings_;
    SpeechQueue speech_;
    nav::GuidanceEmitter guidance_;
    nav::NavigationSession session_;
    EventQueue queue_;
    nav::EventRouter router_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<u64> processed_{0};

    mutable std::mutex snapshot_mutex_;
    nav::SessionSnapshot snapshot_;
};

} // namespace wg::service
