#pragma once

#include "core/types.hpp"
#include "nav/session_state.hpp"
#include "nav/waypoint_id.hpp"

#include <optional>
#include <string>

namespace wg::nav {

class WaypointGraph;

/// Output side of the voice adapter. Implementations must not block the
/// caller for the duration of speech and never report errors back.
class VoiceOutput {
public:
    virtual ~VoiceOutput() = default;
    virtual void speak(const std::string& text) = 0;
};

/// Why the session produced a transition (or an in-state notification).
enum class Cause : u8 {
    Started,        ///< Origin scanned
    RouteComputed,  ///< Destination accepted, route ready
    Advanced,       ///< Expected waypoint confirmed
    Rerouted,       ///< New route after a deviation
    Deviated,       ///< Unexpected waypoint scanned
    Arrived,
    Cancelled,
    RerouteFailed,  ///< No path from the deviated position
    NoPath,         ///< Destination unreachable from the origin
    SameAsOrigin,   ///< Destination equals the origin
    Approaching,    ///< GPS shows progress toward the next waypoint
    Nudge,          ///< Walking without scanning for a long time
};

const char* cause_name(Cause cause);

struct TransitionContext {
    Cause cause = Cause::Started;
    WaypointId current;
    std::optional<WaypointId> next;
    std::optional<WaypointId> destination;
    std::string hint;        ///< Turn hint of the edge toward `next`
    f64 distance_m = 0.0;    ///< Approaching only
    std::string reason;      ///< Cancelled only
};

enum class GuidanceKind : u8 {
    PromptDestination,
    Proceed,
    OffRoute,
    Arrived,
    Aborted,
    Error,
    Progress,
};

struct GuidanceMessage {
    GuidanceKind kind = GuidanceKind::Proceed;
    std::string text;
};

/// Maps each session transition to exactly one spoken instruction.
class GuidanceEmitter {
public:
    GuidanceEmitter(const WaypointGraph& graph, VoiceOutput& voice);

    /// Build the message for a transition and hand it to the voice output.
    GuidanceMessage on_transition(SessionState from, SessionState to,
                                  const TransitionContext& ctx);

    /// Pure mapping, no side effect.
    GuidanceMessage compose(SessionState from, SessionState to,
                            const TransitionContext& ctx) const;

    u64 emitted_count() const { return emitted_; }

private:
    std::string label_of(const std::optional<WaypointId>& id) const;

    const WaypointGraph& graph_;
    VoiceOutput& voice_;
    u64 emitted_ = 0;
};

} // namespace wg::nav
