#include "nav/session.hpp"
#include "nav/waypoint_graph.hpp"

#include <spdlog/spdlog.h>

namespace wg::nav {

NavigationSession::NavigationSession(const WaypointGraph& graph,
                                     GuidanceEmitter& guidance,
                                     NavSettings settings)
    : graph_(graph),
      guidance_(guidance),
      settings_(settings),
      pathfinder_(graph) {}

Result<SessionState> NavigationSession::handle(const NavigationEvent& event) {
    if (auto* ev = std::get_if<WaypointScanned>(&event)) return on_scan(*ev);
    if (auto* ev = std::get_if<DestinationChosen>(&event)) return on_destination(*ev);
    if (auto* ev = std::get_if<PositionSample>(&event)) return on_position(*ev);
    if (auto* ev = std::get_if<Timeout>(&event)) return on_timeout(*ev);
    return on_cancel(std::get<Cancelled>(event));
}

void NavigationSession::reset() {
    state_ = SessionState::Idle;
    current_.reset();
    destination_.reset();
    route_.reset();
    route_index_ = 0;
    deviations_ = 0;
    position_at_last_scan_.reset();
    last_scan_at_.reset();
    last_nudge_at_.reset();
    announced_distance_.reset();
    approach_announced_ = false;
}

std::optional<WaypointId> NavigationSession::next_expected() const {
    if (state_ != SessionState::Navigating || !route_ ||
        route_index_ >= route_->waypoints.size()) {
        return std::nullopt;
    }
    return route_->waypoints[route_index_];
}

SessionSnapshot NavigationSession::snapshot() const {
    SessionSnapshot snap;
    snap.state = state_;
    snap.current = current_;
    snap.destination = destination_;
    snap.next = next_expected();
    if (route_) {
        snap.route = route_->waypoints;
        snap.route_cost = route_->total_cost;
    }
    snap.route_index = route_index_;
    snap.deviations = deviations_;
    snap.trips = trips_;
    snap.last_position = last_position_;
    return snap;
}

// ---------------------------------------------------------------------------
// Scans
// ---------------------------------------------------------------------------

Result<SessionState> NavigationSession::on_scan(const WaypointScanned& ev) {
    if (!graph_.contains(ev.id)) {
        spdlog::warn("Session: scan of unknown waypoint {} ignored", ev.id.str());
        return Error(ErrorCode::UnknownWaypoint,
                     "unknown waypoint '" + ev.id.str() + "'");
    }

    last_scan_at_ = ev.at;
    position_at_last_scan_ = last_position_;
    last_nudge_at_.reset();

    switch (state_) {
        case SessionState::AwaitingDestination:
            if (ev.id == *current_) {
                spdlog::debug("Session: {} already confirmed, waiting for a "
                              "destination", ev.id.str());
                return Error(ErrorCode::UnexpectedEvent,
                             "waypoint " + ev.id.str() + " already confirmed");
            }
            return start_trip(ev.id);
        case SessionState::Idle:
        case SessionState::Arrived:
        case SessionState::Aborted:
            return start_trip(ev.id);
        case SessionState::Navigating:
            return advance(ev.id);
        case SessionState::Deviated:
            return reroute(ev.id);
    }
    return unexpected("WaypointScanned");
}

Result<SessionState> NavigationSession::start_trip(const WaypointId& origin) {
    SessionState from = state_;
    TimestampMs scanned_at = last_scan_at_.value_or(0);

    reset();
    trips_++;
    position_at_last_scan_ = last_position_;
    last_scan_at_ = scanned_at;
    current_ = origin;

    spdlog::info("Session: trip {} starting at {} ({})", trips_, origin.str(),
                 graph_.label(origin));

    // A terminal session passes through Idle; only the resulting state speaks.
    state_ = from;
    TransitionContext ctx;
    ctx.cause = Cause::Started;
    ctx.current = origin;
    transition(SessionState::AwaitingDestination, ctx);
    return state_;
}

Result<SessionState> NavigationSession::advance(const WaypointId& id) {
    const auto expected = next_expected();
    if (!expected) return unexpected("WaypointScanned");

    if (id == *expected) {
        current_ = id;
        route_index_++;
        announced_distance_.reset();
        approach_announced_ = false;

        if (route_index_ >= route_->waypoints.size()) {
            spdlog::info("Session: destination {} reached", id.str());
            TransitionContext ctx;
            ctx.cause = Cause::Arrived;
            ctx.current = id;
            ctx.destination = destination_;
            transition(SessionState::Arrived, ctx);
        } else {
            transition(SessionState::Navigating, step_context(Cause::Advanced));
        }
        return state_;
    }

    if (current_ && id == *current_) {
        spdlog::debug("Session: {} already confirmed, waiting for {}",
                      id.str(), expected->str());
        return Error(ErrorCode::UnexpectedEvent,
                     "waypoint " + id.str() + " already confirmed");
    }

    deviations_++;
    current_ = id;
    spdlog::info("Session: off route at {} (expected {}), deviation #{}",
                 id.str(), expected->str(), deviations_);

    TransitionContext ctx;
    ctx.cause = Cause::Deviated;
    ctx.current = id;
    ctx.destination = destination_;
    transition(SessionState::Deviated, ctx);
    return state_;
}

Result<SessionState> NavigationSession::reroute(const WaypointId& id) {
    current_ = id;
    auto found = pathfinder_.find_route(id, *destination_);
    if (!found) {
        spdlog::warn("Session: re-route from {} failed: {}", id.str(),
                     found.error().message);
        route_.reset();
        route_index_ = 0;

        TransitionContext ctx;
        ctx.cause = Cause::RerouteFailed;
        ctx.current = id;
        ctx.destination = destination_;
        transition(SessionState::Aborted, ctx);
        return found.error();
    }

    route_ = std::move(found.value());
    route_index_ = 1;
    announced_distance_.reset();
    approach_announced_ = false;

    if (route_->hops() == 0) {
        TransitionContext ctx;
        ctx.cause = Cause::Arrived;
        ctx.current = id;
        ctx.destination = destination_;
        transition(SessionState::Arrived, ctx);
        return state_;
    }

    spdlog::info("Session: re-routed: {} (cost {})", route_->describe(),
                 route_->total_cost);
    transition(SessionState::Navigating, step_context(Cause::Rerouted));
    return state_;
}

// ---------------------------------------------------------------------------
// Destination
// ---------------------------------------------------------------------------

Result<SessionState> NavigationSession::on_destination(const DestinationChosen& ev) {
    if (state_ != SessionState::AwaitingDestination) {
        return unexpected("DestinationChosen");
    }
    if (!graph_.contains(ev.id)) {
        spdlog::warn("Session: unknown destination {} ignored", ev.id.str());
        return Error(ErrorCode::UnknownWaypoint,
                     "unknown waypoint '" + ev.id.str() + "'");
    }

    if (ev.id == *current_) {
        TransitionContext ctx;
        ctx.cause = Cause::SameAsOrigin;
        ctx.current = *current_;
        ctx.destination = ev.id;
        transition(SessionState::AwaitingDestination, ctx);
        return Error(ErrorCode::SameAsOrigin,
                     "destination " + ev.id.str() + " is the current waypoint");
    }

    auto found = pathfinder_.find_route(*current_, ev.id);
    if (!found) {
        spdlog::warn("Session: {}", found.error().message);
        TransitionContext ctx;
        ctx.cause = Cause::NoPath;
        ctx.current = *current_;
        ctx.destination = ev.id;
        transition(SessionState::AwaitingDestination, ctx);
        return found.error();
    }

    destination_ = ev.id;
    route_ = std::move(found.value());
    route_index_ = 1;
    spdlog::info("Session: route {} (cost {})", route_->describe(),
                 route_->total_cost);

    transition(SessionState::Navigating, step_context(Cause::RouteComputed));
    return state_;
}

// ---------------------------------------------------------------------------
// Advisory GPS
// ---------------------------------------------------------------------------

Result<SessionState> NavigationSession::on_position(const PositionSample& ev) {
    last_position_ = ev.position;

    const auto next = next_expected();
    if (!next) return state_;
    const auto* target = graph_.find(*next);
    if (!target || !target->position) return state_;

    f64 d = distance_m(ev.position, *target->position);

    bool announce = false;
    if (d <= settings_.approach_radius_m) {
        announce = !approach_announced_;
        approach_announced_ = true;
    } else if (!announced_distance_) {
        announced_distance_ = d;
    } else if (*announced_distance_ - d >= settings_.progress_step_m) {
        announce = true;
    }

    if (announce) {
        announced_distance_ = d;
        TransitionContext ctx = step_context(Cause::Approaching);
        ctx.distance_m = d;
        transition(state_, ctx);
    }
    return state_;
}

Result<SessionState> NavigationSession::on_timeout(const Timeout& ev) {
    if (state_ != SessionState::Navigating && state_ != SessionState::Deviated) {
        return state_;
    }
    if (!last_scan_at_ || ev.at - *last_scan_at_ < settings_.scan_timeout_ms) {
        return state_;
    }
    if (last_nudge_at_ && ev.at - *last_nudge_at_ < settings_.scan_timeout_ms) {
        return state_;
    }
    if (!last_position_ || !position_at_last_scan_) return state_;

    f64 moved = distance_m(*position_at_last_scan_, *last_position_);
    if (moved < settings_.min_movement_m) return state_;

    spdlog::info("Session: no scan for {} ms while moving {:.1f} m, re-prompting",
                 ev.at - *last_scan_at_, moved);
    last_nudge_at_ = ev.at;
    TransitionContext ctx = step_context(Cause::Nudge);
    if (state_ == SessionState::Deviated) {
        ctx.next.reset();
        ctx.hint.clear();
    }
    transition(state_, ctx);
    return state_;
}

Result<SessionState> NavigationSession::on_cancel(const Cancelled& ev) {
    if (is_terminal(state_)) return unexpected("Cancelled");

    spdlog::info("Session: cancelled in {} ({})", session_state_name(state_),
                 ev.reason.empty() ? "no reason given" : ev.reason);
    TransitionContext ctx;
    ctx.cause = Cause::Cancelled;
    ctx.current = current_.value_or(WaypointId{});
    ctx.destination = destination_;
    ctx.reason = ev.reason;
    transition(SessionState::Aborted, ctx);
    return state_;
}

// ---------------------------------------------------------------------------

void NavigationSession::transition(SessionState to, const TransitionContext& ctx) {
    SessionState from = state_;
    state_ = to;
    if (from != to) {
        spdlog::debug("Session: {} -> {} ({})", session_state_name(from),
                      session_state_name(to), cause_name(ctx.cause));
    }
    guidance_.on_transition(from, to, ctx);
}

TransitionContext NavigationSession::step_context(Cause cause) const {
    TransitionContext ctx;
    ctx.cause = cause;
    ctx.current = current_.value_or(WaypointId{});
    ctx.destination = destination_;
    if (route_ && route_index_ > 0 && route_index_ < route_->waypoints.size()) {
        ctx.next = route_->waypoints[route_index_];
        ctx.hint = route_->edges[route_index_ - 1].hint;
    }
    return ctx;
}

Error NavigationSession::unexpected(const char* event_name) const {
    spdlog::info("Session: {} ignored in state {}", event_name,
                 session_state_name(state_));
    return Error(ErrorCode::UnexpectedEvent,
                 std::string(event_name) + " not accepted in state " +
                     session_state_name(state_));
}

} // namespace wg::nav
