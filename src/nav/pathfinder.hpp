#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "nav/waypoint_graph.hpp"

#include <string>
#include <vector>

namespace wg::nav {

struct Route {
    std::vector<WaypointId> waypoints; // origin first, destination last
    std::vector<Edge> edges;           // edges[i] joins waypoints[i] and [i+1]
    f64 total_cost = 0.0;

    size_t hops() const { return edges.size(); }
    bool empty() const { return waypoints.empty(); }
    const WaypointId& origin() const { return waypoints.front(); }
    const WaypointId& destination() const { return waypoints.back(); }

    /// "A1 -> A2 -> A3"
    std::string describe() const;
};

class Pathfinder {
public:
    explicit Pathfinder(const WaypointGraph& graph);

    /// Minimum-cost route from origin to destination (Dijkstra).
    /// Equal-cost routes are ordered by hop count, then by the id sequence,
    /// so the result is fully deterministic. origin == destination yields a
    /// zero-cost single-waypoint route.
    Result<Route> find_route(const WaypointId& origin,
                             const WaypointId& destination) const;

private:
    const WaypointGraph& graph_;
};

} // namespace wg::nav
