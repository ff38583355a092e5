#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <spdlog/spdlog.h>

// Forward declare lua_State to avoid pulling in Lua headers everywhere
struct lua_State;

namespace wg::log {

/// Install the "wayguide" default logger: colored console, plus a truncating
/// file sink unless `log_file` is empty.
void init(const std::filesystem::path& log_file = "wayguide.log",
          spdlog::level::level_enum level = spdlog::level::debug);

/// Level by spdlog name: "trace" .. "off", with "warn" and "err" accepted.
std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

/// Flush and shutdown logging.
void shutdown();

// Topology scripts log through these (registered as LOG, WARN, SPEW)
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);

} // namespace wg::log
