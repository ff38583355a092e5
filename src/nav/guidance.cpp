#include "nav/guidance.hpp"
#include "nav/waypoint_graph.hpp"

#include <cmath>
#include <spdlog/spdlog.h>

namespace wg::nav {

const char* cause_name(Cause cause) {
    switch (cause) {
        case Cause::Started:       return "Started";
        case Cause::RouteComputed: return "RouteComputed";
        case Cause::Advanced:      return "Advanced";
        case Cause::Rerouted:      return "Rerouted";
        case Cause::Deviated:      return "Deviated";
        case Cause::Arrived:       return "Arrived";
        case Cause::Cancelled:     return "Cancelled";
        case Cause::RerouteFailed: return "RerouteFailed";
        case Cause::NoPath:        return "NoPath";
        case Cause::SameAsOrigin:  return "SameAsOrigin";
        case Cause::Approaching:   return "Approaching";
        case Cause::Nudge:         return "Nudge";
    }
    return "Unknown";
}

GuidanceEmitter::GuidanceEmitter(const WaypointGraph& graph, VoiceOutput& voice)
    : graph_(graph), voice_(voice) {}

std::string GuidanceEmitter::label_of(const std::optional<WaypointId>& id) const {
    return id ? graph_.label(*id) : std::string("your destination");
}

GuidanceMessage GuidanceEmitter::compose(SessionState from, SessionState to,
                                         const TransitionContext& ctx) const {
    switch (ctx.cause) {
        case Cause::Started:
            return {GuidanceKind::PromptDestination,
                    "at " + graph_.label(ctx.current) +
                        ", please say your destination code"};

        case Cause::RouteComputed:
        case Cause::Advanced:
        case Cause::Rerouted: {
            std::string text = "proceed to " + label_of(ctx.next);
            if (!ctx.hint.empty()) text = ctx.hint + ", then " + text;
            return {GuidanceKind::Proceed, std::move(text)};
        }

        case Cause::Deviated:
            return {GuidanceKind::OffRoute, "off route, rescanning"};

        case Cause::Arrived:
            return {GuidanceKind::Arrived, "you have arrived"};

        case Cause::Cancelled:
            return {GuidanceKind::Aborted, "navigation cancelled"};

        case Cause::RerouteFailed:
            return {GuidanceKind::Aborted,
                    "no path to destination from here, navigation ended"};

        case Cause::NoPath:
            return {GuidanceKind::Error,
                    "no path found to " + label_of(ctx.destination)};

        case Cause::SameAsOrigin:
            return {GuidanceKind::Error,
                    "you are already at " + graph_.label(ctx.current)};

        case Cause::Approaching: {
            auto metres = static_cast<long>(std::lround(ctx.distance_m));
            return {GuidanceKind::Progress,
                    "getting closer to " + label_of(ctx.next) + ", about " +
                        std::to_string(metres) + " metres"};
        }

        case Cause::Nudge:
            if (!ctx.next) {
                return {GuidanceKind::Progress, "please scan the nearest code"};
            }
            return {GuidanceKind::Progress,
                    "please scan the next code, " + label_of(ctx.next)};
    }

    spdlog::warn("Guidance: unhandled cause {} ({} -> {})",
                 cause_name(ctx.cause), session_state_name(from),
                 session_state_name(to));
    return {GuidanceKind::Error, "please wait"};
}

GuidanceMessage GuidanceEmitter::on_transition(SessionState from,
                                               SessionState to,
                                               const TransitionContext& ctx) {
    GuidanceMessage msg = compose(from, to, ctx);
    spdlog::debug("Guidance: {} -> {} ({}): \"{}\"", session_state_name(from),
                  session_state_name(to), cause_name(ctx.cause), msg.text);
    voice_.speak(msg.text);
    emitted_++;
    return msg;
}

} // namespace wg::nav
