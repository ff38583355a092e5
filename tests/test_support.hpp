#pragma once

#include "nav/guidance.hpp"
#include "nav/waypoint_graph.hpp"

#include <initializer_list>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

namespace wg::test {

/// Voice output that keeps everything it was asked to say.
class RecordingVoice : public nav::VoiceOutput {
public:
    void speak(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        spoken_.push_back(text);
    }

    std::vector<std::string> spoken() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spoken_;
    }

    std::string last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spoken_.empty() ? std::string() : spoken_.back();
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spoken_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> spoken_;
};

/// Undirected topology from ids and (from, to, cost) triples. Labels
/// default to the id text.
inline nav::TopologySpec make_topology(
    std::initializer_list<const char*> ids,
    std::initializer_list<std::tuple<const char*, const char*, double>> edges) {
    nav::TopologySpec spec;
    for (const char* id : ids) {
        spec.waypoints.push_back(nav::WaypointSpec{id, "", std::nullopt});
    }
    for (const auto& [from, to, cost] : edges) {
        nav::EdgeSpec e;
        e.from = from;
        e.to = to;
        e.cost = cost;
        spec.edges.push_back(e);
    }
    return spec;
}

/// A1-A2 cost 2, A2-A3 cost 3, A1-A3 cost 10.
inline nav::WaypointGraph triangle_graph() {
    auto graph = nav::WaypointGraph::load(make_topology(
        {"A1", "A2", "A3"},
        {{"A1", "A2", 2.0}, {"A2", "A3", 3.0}, {"A1", "A3", 10.0}}));
    return graph.value();
}

/// Two components: A1-A2-A3 and B1-B2.
inline nav::WaypointGraph split_graph() {
    auto graph = nav::WaypointGraph::load(make_topology(
        {"A1", "A2", "A3", "B1", "B2"},
        {{"A1", "A2", 1.0}, {"A2", "A3", 1.0}, {"B1", "B2", 1.0}}));
    return graph.value();
}

inline nav::WaypointId id(const char* text) {
    return *nav::WaypointId::parse(text);
}

} // namespace wg::test
