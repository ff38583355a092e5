#include "service/navigation_service.hpp"
#include "core/clock.hpp"
#include "nav/waypoint_graph.hpp"

#include <spdlog/spdlog.h>

namespace wg::service {

NavigationService::NavigationService(
    std::shared_ptr<const nav::WaypointGraph> graph, nav::VoiceOutput& voice,
    const nav::NavSettings& settings)
    : graph_(std::move(graph)),
      settings_(settings),
      speech_(voice),
      guidance_(*graph_, speech_),
      session_(*graph_, guidance_, settings_),
      router_(queue_, settings_) {}

NavigationService::~NavigationService() {
    stop();
}

void NavigationService::start() {
    if (running_.exchange(true)) return;

    speech_.start();
    publish_snapshot();
    worker_ = std::thread(&NavigationService::run, this);
    spdlog::info("Navigation service started ({} waypoints)", graph_->size());

    speech_.speak("please scan the starting code");
}

void NavigationService::stop() {
    if (!running_.exchange(false)) return;

    queue_.close();
    if (worker_.joinable()) worker_.join();
    speech_.stop();

    auto stats = router_.stats();
    spdlog::info("Navigation service stopped: {} events handled, {} scans "
                 "debounced, {} GPS samples rejected, {} out of order",
                 processed_.load(), stats.scans_debounced,
                 stats.positions_implausible, stats.out_of_order);
}

nav::SessionSnapshot NavigationService::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

bool NavigationService::wait_idle(std::chrono::milliseconds timeout) {
    return queue_.wait_drained(timeout);
}

void NavigationService::publish_snapshot() {
    auto snap = session_.snapshot();
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = std::move(snap);
}

void NavigationService::run() {
    TimestampMs last_tick = now_ms();

    for (;;) {
        auto event = queue_.pop_for(POLL_INTERVAL);
        if (event) {
            auto result = session_.handle(*event);
            if (!result) {
                spdlog::debug("Session: {} -> {}: {}", nav::event_name(*event),
                              error_code_name(result.error().code),
                              result.error().message);
            }
            processed_++;
            publish_snapshot();
            queue_.task_done();
        } else if (queue_.closed()) {
            break;
        }

        // Soft idle wake-up; the session decides whether it is worth a nudge.
        TimestampMs now = now_ms();
        if (now - last_tick >= settings_.scan_timeout_ms) {
            last_tick = now;
            router_.report_timeout(now);
        }
    }
}

} // namespace wg::service
