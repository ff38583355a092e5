#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "nav/guidance.hpp"
#include "nav/navigation_event.hpp"
#include "nav/pathfinder.hpp"
#include "nav/session_state.hpp"
#include "nav/settings.hpp"

#include <optional>
#include <vector>

namespace wg::nav {

class WaypointGraph;

/// Read-only copy of session state for the monitoring adapter.
struct SessionSnapshot {
    SessionState state = SessionState::Idle;
    std::optional<WaypointId> current;
    std::optional<WaypointId> destination;
    std::optional<WaypointId> next;
    std::vector<WaypointId> route;
    size_t route_index = 0;   ///< Index of `next` inside `route`
    f64 route_cost = 0.0;
    u32 deviations = 0;
    u32 trips = 0;            ///< Trips started since the session was created
    std::optional<GeoPoint> last_position;
};

/// One user's trip as a state machine. Not thread-safe: events must be
/// delivered one at a time (see service::NavigationService).
///
/// handle() never throws. It returns the resulting state, or an Error whose
/// code names the recoverable condition (UnknownWaypoint, NoPathExists,
/// SameAsOrigin, UnexpectedEvent). A NoPathExists while Deviated ends the
/// trip: the error is returned and state() is Aborted.
class NavigationSession {
public:
    NavigationSession(const WaypointGraph& graph, GuidanceEmitter& guidance,
                      NavSettings settings = {});

    Result<SessionState> handle(const NavigationEvent& event);

    /// Drop the trip and return to Idle without any guidance. The last GPS
    /// position and the trip counter are kept.
    void reset();

    SessionState state() const { return state_; }
    const std::optional<WaypointId>& current() const { return current_; }
    const std::optional<WaypointId>& destination() const { return destination_; }
    const std::optional<Route>& route() const { return route_; }
    size_t route_index() const { return route_index_; }
    std::optional<WaypointId> next_expected() const;
    u32 deviation_count() const { return deviations_; }

    SessionSnapshot snapshot() const;

private:
    Result<SessionState> on_scan(const WaypointScanned& ev);
    Result<SessionState> on_destination(const DestinationChosen& ev);
    Result<SessionState> on_position(const PositionSample& ev);
    Result<SessionState> on_timeout(const Timeout& ev);
    Result<SessionState> on_cancel(const Cancelled& ev);

    Result<SessionState> start_trip(const WaypointId& origin);
    Result<SessionState> advance(const WaypointId& id);
    Result<SessionState> reroute(const WaypointId& id);

    /// Change state and emit exactly one guidance message.
    void transition(SessionState to, const TransitionContext& ctx);

    /// Context pointing at the next expected waypoint, with the turn hint
    /// of the edge leading to it.
    TransitionContext step_context(Cause cause) const;

    Error unexpected(const char* event_name) const;

    const WaypointGraph& graph_;
    GuidanceEmitter& guidance_;
    NavSettings settings_;
    Pathfinder pathfinder_;

    SessionState state_ = SessionState::Idle;
    std::optional<WaypointId> current_;
    std::optional<WaypointId> destination_;
    std::optional<Route> route_;
    size_t route_index_ = 0;
    u32 deviations_ = 0;
    u32 trips_ = 0;

    // Advisory GPS tracking
    std::optional<GeoPoint> last_position_;
    std::optional<GeoPoint> position_at_last_scan_;
    std::optional<TimestampMs> last_scan_at_;
    std::optional<TimestampMs> last_nudge_at_;
    std::optional<f64> announced_distance_;
    bool approach_announced_ = false;
};

} // namespace wg::nav
