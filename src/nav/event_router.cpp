#include "nav/event_router.hpp"

#include <spdlog/spdlog.h>

namespace wg::nav {

namespace {

/// Distance covered between two fixes is within walking reach.
bool plausible_step(const PositionSample& from, const PositionSample& to,
                    f64 max_speed_mps) {
    TimestampMs dt = to.at - from.at;
    if (dt <= 0) return false;
    f64 allowed = max_speed_mps * static_cast<f64>(dt) / 1000.0;
    return distance_m(from.position, to.position) <= allowed;
}

} // namespace

EventRouter::EventRouter(EventSink& sink, const NavSettings& settings)
    : sink_(sink), settings_(settings) {}

bool EventRouter::report_scan(std::string_view code, TimestampMs at) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (last_scan_at_ && at < *last_scan_at_) {
        stats_.out_of_order++;
        spdlog::debug("Router: out-of-order scan at {} dropped", at);
        return false;
    }
    last_scan_at_ = at;

    auto id = WaypointId::parse(code);
    if (!id) {
        stats_.scans_not_waypoint++;
        spdlog::debug("Router: '{}' is not a waypoint code", code);
        return false;
    }

    auto it = last_seen_scan_.find(*id);
    bool repeat = it != last_seen_scan_.end() &&
                  at - it->second < settings_.debounce_ms;
    last_seen_scan_[*id] = at;
    if (repeat) {
        stats_.scans_debounced++;
        return false;
    }

    stats_.scans_forwarded++;
    sink_.push(WaypointScanned{*id, at});
    return true;
}

bool EventRouter::report_position(f64 lat, f64 lon, TimestampMs at) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (last_position_at_ && at < *last_position_at_) {
        stats_.out_of_order++;
        spdlog::debug("Router: out-of-order position at {} dropped", at);
        return false;
    }
    last_position_at_ = at;

    GeoPoint p{lat, lon};
    if (!is_valid(p)) {
        stats_.positions_implausible++;
        return false;
    }

    PositionSample sample{p, at};
    // Allowed distance grows with time since the last accepted fix, so a
    // genuine jump is eventually accepted.
    if (last_fix_ && !plausible_step(*last_fix_, sample, settings_.max_speed_mps)) {
        if (!confirms_candidate(sample)) {
            stats_.positions_implausible++;
            spdlog::debug("Router: implausible GPS jump of {:.1f} m in {} ms",
                          distance_m(last_fix_->position, p), at - last_fix_->at);
            return false;
        }
        spdlog::info("Router: GPS reference moved after {} consistent fixes",
                     candidate_run_);
    }

    last_fix_ = sample;
    candidate_fix_.reset();
    candidate_run_ = 0;
    stats_.positions_forwarded++;
    sink_.push(sample);
    return true;
}

bool EventRouter::report_destination(std::string_view phrase, TimestampMs at) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto id = WaypointId::parse_spoken(phrase);
    if (!id) {
        stats_.destinations_unrecognized++;
        spdlog::info("Router: unrecognized destination '{}'", phrase);
        return false;
    }

    stats_.destinations_forwarded++;
    sink_.push(DestinationChosen{*id, at});
    return true;
}

void EventRouter::report_cancel(std::string reason, TimestampMs at) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.cancels++;
    sink_.push(Cancelled{std::move(reason), at});
}

void EventRouter::report_timeout(TimestampMs at) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.timeouts++;
    sink_.push(Timeout{at});
}

bool EventRouter::confirms_candidate(const PositionSample& sample) {
    if (candidate_fix_ &&
        plausible_step(*candidate_fix_, sample, settings_.max_speed_mps)) {
        candidate_run_++;
    } else {
        candidate_run_ = 1;
    }
    candidate_fix_ = sample;
    return candidate_run_ >= REANCHOR_FIXES;
}

RouterStats EventRouter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace wg::nav
