#include "nav/navigation_event.hpp"

namespace wg::nav {

namespace {

struct NameVisitor {
    const char* operator()(const WaypointScanned&) const { return "WaypointScanned"; }
    const char* operator()(const DestinationChosen&) const { return "DestinationChosen"; }
    const char* operator()(const PositionSample&) const { return "PositionSample"; }
    const char* operator()(const Timeout&) const { return "Timeout"; }
    const char* operator()(const Cancelled&) const { return "Cancelled"; }
};

} // namespace

const char* event_name(const NavigationEvent& event) {
    return std::visit(NameVisitor{}, event);
}

TimestampMs event_time(const NavigationEvent& event) {
    return std::visit([](const auto& e) { return e.at; }, event);
}

} // namespace wg::nav
