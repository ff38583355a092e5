#include "nav/waypoint_graph.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace wg::nav {

namespace {

Error invalid(std::string msg) {
    return Error(ErrorCode::InvalidTopology, std::move(msg));
}

} // namespace

Result<WaypointGraph> WaypointGraph::load(const TopologySpec& topology) {
    WaypointGraph graph;

    for (const auto& spec : topology.waypoints) {
        auto id = WaypointId::parse(spec.id);
        if (!id) {
            return invalid("malformed waypoint id '" + spec.id + "'");
        }
        if (graph.waypoints_.count(*id)) {
            return invalid("duplicate waypoint id '" + id->str() + "'");
        }
        if (spec.position && !is_valid(*spec.position)) {
            return invalid("waypoint '" + id->str() +
                           "' has an out-of-range coordinate");
        }

        Waypoint wp;
        wp.id = *id;
        wp.label = spec.label.empty() ? id->str() : spec.label;
        wp.position = spec.position;
        graph.waypoints_.emplace(*id, std::move(wp));
        graph.adjacency_[*id];
    }

    auto add_direction = [&graph](const WaypointId& from, const WaypointId& to,
                                  f64 cost, const std::string& hint) -> bool {
        auto& out = graph.adjacency_[from];
        for (const auto& e : out) {
            if (e.to == to) return false;
        }
        out.push_back(Edge{from, to, cost, hint});
        return true;
    };

    for (const auto& spec : topology.edges) {
        auto from = WaypointId::parse(spec.from);
        auto to = WaypointId::parse(spec.to);
        if (!from || !graph.contains(*from)) {
            return invalid("edge references unknown waypoint '" + spec.from + "'");
        }
        if (!to || !graph.contains(*to)) {
            return invalid("edge references unknown waypoint '" + spec.to + "'");
        }
        if (*from == *to) {
            return invalid("self-loop on waypoint '" + from->str() + "'");
        }
        if (!std::isfinite(spec.cost) || spec.cost < 0.0) {
            return invalid("edge " + from->str() + "-" + to->str() +
                           " has a negative or non-finite cost");
        }

        if (spec.directed && !spec.hint_back.empty()) {
            spdlog::warn("Directed edge {}-{}: hint_back ignored", from->str(),
                         to->str());
        }

        bool added = add_direction(*from, *to, spec.cost, spec.hint);
        if (added && !spec.directed) {
            added = add_direction(*to, *from, spec.cost, spec.hint_back);
        }
        if (!added) {
            return invalid("duplicate edge " + from->str() + "-" + to->str());
        }
        graph.edge_count_++;
    }

    for (auto& [id, out] : graph.adjacency_) {
        std::sort(out.begin(), out.end(),
                  [](const Edge& a, const Edge& b) { return a.to < b.to; });
    }

    spdlog::info("Waypoint graph loaded: {} waypoints, {} edges",
                 graph.size(), graph.edge_count());
    return graph;
}

Result<std::vector<Edge>> WaypointGraph::neighbors(const WaypointId& id) const {
    const auto* out = outgoing(id);
    if (!out) {
        return Error(ErrorCode::UnknownWaypoint,
                     "unknown waypoint '" + id.str() + "'");
    }
    return *out;
}

const std::vector<Edge>* WaypointGraph::outgoing(const WaypointId& id) const {
    auto it = adjacency_.find(id);
    if (it == adjacency_.end()) return nullptr;
    return &it->second;
}

const Waypoint* WaypointGraph::find(const WaypointId& id) const {
    auto it = waypoints_.find(id);
    return it != waypoints_.end() ? &it->second : nullptr;
}

std::string WaypointGraph::label(const WaypointId& id) const {
    const auto* wp = find(id);
    return wp ? wp->label : id.str();
}

const Edge* WaypointGraph::edge(const WaypointId& from,
                                const WaypointId& to) const {
    const auto* out = outgoing(from);
    if (!out) return nullptr;
    for (const auto& e : *out) {
        if (e.to == to) return &e;
    }
    return nullptr;
}

std::vector<WaypointId> WaypointGraph::waypoint_ids() const {
    std::vector<WaypointId> ids;
    ids.reserve(waypoints_.size());
    for (const auto& [id, wp] : waypoints_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace wg::nav
