#include "nav/pathfinder.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <queue>
#include <spdlog/spdlog.h>

namespace wg::nav {

std::string Route::describe() const {
    std::string out;
    for (size_t i = 0; i < waypoints.size(); ++i) {
        if (i > 0) out += " -> ";
        out += waypoints[i].str();
    }
    return out;
}

namespace {

constexpr f64 COST_EPSILON = 1e-9;

/// Costs that differ only by summation rounding (0.7 + 0.1 vs 0.8) count as
/// equal so the hop and id tie-breaks still apply.
bool same_cost(f64 a, f64 b) {
    f64 scale = std::max({1.0, std::abs(a), std::abs(b)});
    return std::abs(a - b) <= COST_EPSILON * scale;
}

/// Best-known way of reaching a node. Ordered by (cost, hops, sequence).
/// Every prefix of an optimal label is itself optimal for its end node, so
/// plain label-setting Dijkstra over this ordering yields the tie-broken
/// optimum.
struct Label {
    f64 cost = 0.0;
    std::vector<WaypointId> path;

    bool operator<(const Label& o) const {
        if (!same_cost(cost, o.cost)) return cost < o.cost;
        if (path.size() != o.path.size()) return path.size() < o.path.size();
        return std::lexicographical_compare(path.begin(), path.end(),
                                            o.path.begin(), o.path.end());
    }
    bool operator>(const Label& o) const { return o < *this; }
};

} // namespace

Pathfinder::Pathfinder(const WaypointGraph& graph) : graph_(graph) {}

Result<Route> Pathfinder::find_route(const WaypointId& origin,
                                     const WaypointId& destination) const {
    if (!graph_.contains(origin)) {
        return Error(ErrorCode::UnknownWaypoint,
                     "unknown origin '" + origin.str() + "'");
    }
    if (!graph_.contains(destination)) {
        return Error(ErrorCode::UnknownWaypoint,
                     "unknown destination '" + destination.str() + "'");
    }

    std::map<WaypointId, Label> best;
    std::map<WaypointId, bool> settled;
    std::priority_queue<Label, std::vector<Label>, std::greater<Label>> open;

    Label start;
    start.path.push_back(origin);
    best[origin] = start;
    open.push(start);

    const Label* found = nullptr;
    while (!open.empty()) {
        Label current = open.top();
        open.pop();

        const WaypointId& node = current.path.back();
        if (settled[node]) continue;
        settled[node] = true;

        if (node == destination) {
            found = &best[node];
            break;
        }

        for (const auto& e : *graph_.outgoing(node)) {
            if (settled[e.to]) continue;

            Label next;
            next.cost = current.cost + e.cost;
            next.path = current.path;
            next.path.push_back(e.to);

            auto it = best.find(e.to);
            if (it == best.end() || next < it->second) {
                best[e.to] = next;
                open.push(std::move(next));
            }
        }
    }

    if (!found) {
        spdlog::debug("Pathfinder: no path from {} to {}",
                      origin.str(), destination.str());
        return Error(ErrorCode::NoPathExists,
                     "no path from " + origin.str() + " to " +
                         destination.str());
    }

    Route route;
    route.waypoints = found->path;
    route.total_cost = found->cost;
    for (size_t i = 0; i + 1 < route.waypoints.size(); ++i) {
        route.edges.push_back(
            *graph_.edge(route.waypoints[i], route.waypoints[i + 1]));
    }

    spdlog::debug("Pathfinder: {} (cost {}, {} hops)", route.describe(),
                  route.total_cost, route.hops());
    return route;
}

} // namespace wg::nav
