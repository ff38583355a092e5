#pragma once

#include "core/types.hpp"
#include "nav/geo.hpp"
#include "nav/waypoint_id.hpp"

#include <string>
#include <variant>

namespace wg::nav {

struct WaypointScanned {
    WaypointId id;
    TimestampMs at = 0;
};

struct DestinationChosen {
    WaypointId id;
    TimestampMs at = 0;
};

struct PositionSample {
    GeoPoint position;
    TimestampMs at = 0;
};

/// Idle wake-up: no event arrived for the configured scan timeout.
struct Timeout {
    TimestampMs at = 0;
};

/// Explicit cancel from the user or the operator.
struct Cancelled {
    std::string reason;
    TimestampMs at = 0;
};

using NavigationEvent = std::variant<WaypointScanned, DestinationChosen,
                                     PositionSample, Timeout, Cancelled>;

const char* event_name(const NavigationEvent& event);
TimestampMs event_time(const NavigationEvent& event);

/// Receives normalized events in delivery order.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void push(NavigationEvent event) = 0;
};

} // namespace wg::nav
