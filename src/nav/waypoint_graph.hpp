#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "nav/geo.hpp"
#include "nav/waypoint_id.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wg::nav {

/// Declarative waypoint entry, as read from a topology file.
struct WaypointSpec {
    std::string id;
    std::string label;              // empty = use the id text
    std::optional<GeoPoint> position;
};

/// Declarative edge entry. Undirected unless `directed` is set. A hint is a
/// walking instruction and only holds in one direction: `hint` applies from
/// `from` to `to`, `hint_back` to the reverse of an undirected edge.
struct EdgeSpec {
    std::string from;
    std::string to;
    f64 cost = 1.0;
    std::string hint;               // e.g. "turn left"
    std::string hint_back;
    bool directed = false;
};

struct TopologySpec {
    std::vector<WaypointSpec> waypoints;
    std::vector<EdgeSpec> edges;
};

struct Waypoint {
    WaypointId id;
    std::string label;
    std::optional<GeoPoint> position;
};

/// One traversable direction of a connection.
struct Edge {
    WaypointId from;
    WaypointId to;
    f64 cost = 0.0;
    std::string hint;
};

/// Immutable waypoint/edge graph. Built once by load(), then shared
/// read-only by every session.
class WaypointGraph {
public:
    /// Validate and build a graph. Fails with InvalidTopology on malformed
    /// ids, duplicate waypoints, dangling/duplicate edges, self-loops or
    /// negative costs.
    static Result<WaypointGraph> load(const TopologySpec& topology);

    /// Outgoing edges of `id`, ordered by target id.
    Result<std::vector<Edge>> neighbors(const WaypointId& id) const;

    /// Outgoing edges without copying; nullptr if `id` is absent.
    const std::vector<Edge>* outgoing(const WaypointId& id) const;

    bool contains(const WaypointId& id) const {
        return waypoints_.count(id) != 0;
    }
    const Waypoint* find(const WaypointId& id) const;

    /// Human-readable label; the id text for unknown ids.
    std::string label(const WaypointId& id) const;

    const Edge* edge(const WaypointId& from, const WaypointId& to) const;

    /// All waypoint ids in ascending order.
    std::vector<WaypointId> waypoint_ids() const;

    size_t size() const { return waypoints_.size(); }
    size_t edge_count() const { return edge_count_; }

private:
    WaypointGraph() = default;

    std::map<WaypointId, Waypoint> waypoints_;
    std::map<WaypointId, std::vector<Edge>> adjacency_;
    size_t edge_count_ = 0;
};

} // namespace wg::nav
