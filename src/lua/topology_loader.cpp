#include "lua/topology_loader.hpp"
#include "core/log.hpp"
#include "lua/lua_state.hpp"

#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace wg::lua {

namespace {

Error invalid(std::string msg) {
    return Error(ErrorCode::InvalidTopology, std::move(msg));
}

/// Read a string field from the table at the given stack index.
/// Returns empty string if field doesn't exist or isn't a string.
std::string read_string_field(lua_State* L, int table_idx, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    std::string result;
    if (lua_isstring(L, -1)) {
        result = lua_tostring(L, -1);
    }
    lua_pop(L, 1);
    return result;
}

/// Read a numeric field from the table at the given stack index.
f64 read_number_field(lua_State* L, int table_idx, const char* key,
                      f64 default_val = 0.0) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    f64 result = default_val;
    if (lua_isnumber(L, -1)) {
        result = lua_tonumber(L, -1);
    }
    lua_pop(L, 1);
    return result;
}

bool has_field(lua_State* L, int table_idx, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    bool present = !lua_isnil(L, -1);
    lua_pop(L, 1);
    return present;
}

bool field_is_number(lua_State* L, int table_idx, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    bool is_number = lua_isnumber(L, -1) != 0;
    lua_pop(L, 1);
    return is_number;
}

bool read_bool_field(lua_State* L, int table_idx, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    bool result = lua_toboolean(L, -1) != 0;
    lua_pop(L, 1);
    return result;
}

/// Push t[key] and return its absolute index if it is a table.
/// Leaves nothing on the stack and returns 0 otherwise.
int push_table_field(lua_State* L, int table_idx, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return 0;
    }
    return lua_gettop(L);
}

} // namespace

void TopologyLoader::register_helpers(LuaState& state) {
    state.register_function("LOG", log::l_LOG);
    state.register_function("WARN", log::l_WARN);
    state.register_function("SPEW", log::l_SPEW);
}

Result<TopologyFile> TopologyLoader::load_file(LuaState& state,
                                               const fs::path& path) {
    spdlog::info("Loading topology: {}", path.string());
    register_helpers(state);

    auto run = state.do_file(path);
    if (!run) {
        return invalid(path.string() + ": " + run.error().message);
    }
    return extract(state.raw());
}

Result<TopologyFile> TopologyLoader::load_string(LuaState& state,
                                                 std::string_view code) {
    register_helpers(state);

    auto run = state.do_string(code);
    if (!run) {
        return invalid(run.error().message);
    }
    return extract(state.raw());
}

Result<TopologyFile> TopologyLoader::extract(lua_State* L) {
    TopologyFile out;
    int base = lua_gettop(L);

    lua_getglobal(L, "Topology");
    if (!lua_istable(L, -1)) {
        lua_settop(L, base);
        return invalid("global 'Topology' table not defined");
    }
    int topo_idx = lua_gettop(L);

    out.name = read_string_field(L, topo_idx, "name");

    auto wps = read_waypoints(L, topo_idx, out);
    if (!wps) {
        lua_settop(L, base);
        return wps.error();
    }
    auto edges = read_edges(L, topo_idx, out);
    lua_settop(L, base);
    if (!edges) return edges.error();

    read_settings(L, out.settings);

    spdlog::info("Topology '{}': {} waypoints, {} edges",
                 out.name.empty() ? "unnamed" : out.name,
                 out.topology.waypoints.size(), out.topology.edges.size());
    return out;
}

Result<void> TopologyLoader::read_waypoints(lua_State* L, int topo_idx,
                                            TopologyFile& out) {
    int list_idx = push_table_field(L, topo_idx, "waypoints");
    if (list_idx == 0) return invalid("Topology.waypoints must be a table");

    for (int i = 1; ; i++) {
        lua_pushnumber(L, i);
        lua_gettable(L, list_idx);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        if (!lua_istable(L, -1)) {
            lua_pop(L, 2);
            return invalid("Topology.waypoints[" + std::to_string(i) +
                           "] is not a table");
        }
        int wp_idx = lua_gettop(L);

        nav::WaypointSpec wp;
        wp.id = read_string_field(L, wp_idx, "id");
        wp.label = read_string_field(L, wp_idx, "label");
        if (field_is_number(L, wp_idx, "lat") &&
            field_is_number(L, wp_idx, "lon")) {
            wp.position = nav::GeoPoint{read_number_field(L, wp_idx, "lat"),
                                        read_number_field(L, wp_idx, "lon")};
        }
        lua_pop(L, 1);

        if (wp.id.empty()) {
            lua_pop(L, 1);
            return invalid("Topology.waypoints[" + std::to_string(i) +
                           "] has no id");
        }
        out.topology.waypoints.push_back(std::move(wp));
    }

    lua_pop(L, 1); // waypoints
    return {};
}

Result<void> TopologyLoader::read_edges(lua_State* L, int topo_idx,
                                        TopologyFile& out) {
    int list_idx = push_table_field(L, topo_idx, "edges");
    if (list_idx == 0) {
        // A single-room topology without connections is legal.
        return {};
    }

    for (int i = 1; ; i++) {
        lua_pushnumber(L, i);
        lua_gettable(L, list_idx);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        std::string where = "Topology.edges[" + std::to_string(i) + "]";
        if (!lua_istable(L, -1)) {
            lua_pop(L, 2);
            return invalid(where + " is not a table");
        }
        int edge_idx = lua_gettop(L);

        nav::EdgeSpec edge;
        edge.from = read_string_field(L, edge_idx, "from");
        edge.to = read_string_field(L, edge_idx, "to");
        edge.hint = read_string_field(L, edge_idx, "hint");
        edge.hint_back = read_string_field(L, edge_idx, "hint_back");
        edge.directed = read_bool_field(L, edge_idx, "directed");
        bool bad_cost = has_field(L, edge_idx, "cost") &&
                        !field_is_number(L, edge_idx, "cost");
        edge.cost = read_number_field(L, edge_idx, "cost", 1.0);
        lua_pop(L, 1);

        if (edge.from.empty() || edge.to.empty()) {
            lua_pop(L, 1);
            return invalid(where + " needs 'from' and 'to'");
        }
        if (bad_cost) {
            lua_pop(L, 1);
            return invalid(where + " has a non-numeric cost");
        }
        out.topology.edges.push_back(std::move(edge));
    }

    lua_pop(L, 1); // edges
    return {};
}

void TopologyLoader::read_settings(lua_State* L, nav::NavSettings& settings) {
    int base = lua_gettop(L);
    lua_getglobal(L, "Settings");
    if (!lua_istable(L, -1)) {
        lua_settop(L, base);
        return;
    }
    int idx = lua_gettop(L);

    settings.debounce_ms = static_cast<i64>(read_number_field(
        L, idx, "debounce_ms", static_cast<f64>(settings.debounce_ms)));
    settings.max_speed_mps =
        read_number_field(L, idx, "max_speed_mps", settings.max_speed_mps);
    settings.scan_timeout_ms = static_cast<i64>(read_number_field(
        L, idx, "scan_timeout_ms", static_cast<f64>(settings.scan_timeout_ms)));
    settings.min_movement_m =
        read_number_field(L, idx, "min_movement_m", settings.min_movement_m);
    settings.approach_radius_m = read_number_field(
        L, idx, "approach_radius_m", settings.approach_radius_m);
    settings.progress_step_m =
        read_number_field(L, idx, "progress_step_m", settings.progress_step_m);

    lua_settop(L, base);
    spdlog::debug("Settings: debounce {} ms, max speed {} m/s, scan timeout {} ms",
                  settings.debounce_ms, settings.max_speed_mps,
                  settings.scan_timeout_ms);
}

} // namespace wg::lua
