#pragma once

#include "core/types.hpp"
#include "nav/navigation_event.hpp"
#include "nav/settings.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace wg::nav {

/// Diagnostic counters. Drops are sensor noise, never errors.
struct RouterStats {
    u64 scans_forwarded = 0;
    u64 scans_debounced = 0;
    u64 scans_not_waypoint = 0;     ///< QR text that is not a waypoint id
    u64 positions_forwarded = 0;
    u64 positions_implausible = 0;  ///< Out of range or too fast
    u64 destinations_forwarded = 0;
    u64 destinations_unrecognized = 0;
    u64 out_of_order = 0;
    u64 timeouts = 0;
    u64 cancels = 0;
};

/// Turns raw adapter callbacks into NavigationEvents. Safe to call from any
/// number of producer threads; events reach the sink in arrival order.
///
/// A code that stays in view is forwarded once: every sighting restarts its
/// debounce window. GPS fixes are checked against the last accepted fix; a
/// run of REANCHOR_FIXES rejected fixes that agree with each other replaces
/// the reference, so one bad fix cannot lock the filter.
class EventRouter {
public:
    static constexpr int REANCHOR_FIXES = 3;

    EventRouter(EventSink& sink, const NavSettings& settings);

    /// Decoded QR text. Returns false if the scan was dropped.
    bool report_scan(std::string_view code, TimestampMs at);

    /// Raw GPS fix. Returns false if rejected as noise.
    bool report_position(f64 lat, f64 lon, TimestampMs at);

    /// Recognized speech for a destination code. Returns false when the
    /// phrase is not a waypoint id; the voice adapter should ask again.
    bool report_destination(std::string_view phrase, TimestampMs at);

    void report_cancel(std::string reason, TimestampMs at);
    void report_timeout(TimestampMs at);

    RouterStats stats() const;

private:
    bool confirms_candidate(const PositionSample& sample);

    mutable std::mutex mutex_;
    EventSink& sink_;
    NavSettings settings_;
    RouterStats stats_;

    std::optional<TimestampMs> last_scan_at_;
    std::map<WaypointId, TimestampMs> last_seen_scan_;
    std::optional<TimestampMs> last_position_at_;
    std::optional<PositionSample> last_fix_;
    std::optional<PositionSample> candidate_fix_;   ///< Latest rejected fix
    int candidate_run_ = 0;
};

} // namespace wg::nav
