#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "nav/settings.hpp"
#include "nav/waypoint_graph.hpp"

#include <string>
#include <string_view>

struct lua_State;

namespace wg::lua {

class LuaState;

/// Everything a topology file declares.
struct TopologyFile {
    std::string name;              ///< Topology.name, optional
    nav::TopologySpec topology;
    nav::NavSettings settings;     ///< Defaults overlaid with the Settings table
};

/// Runs a topology file and extracts its global tables:
///
///     Topology = {
///         name = "5th floor",
///         waypoints = { { id = "A1", label = "Room 515", lat = .., lon = .. }, ... },
///         edges = { { from = "A1", to = "A2", cost = 4, hint = "turn left" }, ... },
///     }
///     Settings = { debounce_ms = 1500, max_speed_mps = 3.0, ... }
///
/// Scripts may call LOG/WARN/SPEW. Any script or structural error is
/// reported as InvalidTopology.
class TopologyLoader {
public:
    Result<TopologyFile> load_file(LuaState& state, const fs::path& path);
    Result<TopologyFile> load_string(LuaState& state, std::string_view code);

private:
    void register_helpers(LuaState& state);
    Result<TopologyFile> extract(lua_State* L);
    Result<void> read_waypoints(lua_State* L, int topo_idx, TopologyFile& out);
    Result<void> read_edges(lua_State* L, int topo_idx, TopologyFile& out);
    void read_settings(lua_State* L, nav::NavSettings& settings);
};

} // namespace wg::lua
