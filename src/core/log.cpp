#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace wg::log {

void init(const std::filesystem::path& log_file,
          spdlog::level::level_enum level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            log_file.string(), true));
    }

    auto logger =
        std::make_shared<spdlog::logger>("wayguide", sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);
    spdlog::info("WayGuide v0.1.0 (log level {})",
                 spdlog::level::to_string_view(level));
}

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
    // from_str maps anything it does not know to "off".
    auto level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off && name != "off") return std::nullopt;
    return level;
}

void shutdown() {
    spdlog::shutdown();
}

namespace {

/// Arguments of a LOG call joined into one line; tables and functions
/// show up by type name.
std::string script_message(lua_State* L) {
    std::string text;
    for (int i = 1, n = lua_gettop(L); i <= n; ++i) {
        switch (lua_type(L, i)) {
            case LUA_TNUMBER:
            case LUA_TSTRING: text += lua_tostring(L, i); break;
            case LUA_TBOOLEAN: text += lua_toboolean(L, i) ? "true" : "false"; break;
            case LUA_TNIL: text += "nil"; break;
            default: text += lua_typename(L, lua_type(L, i)); break;
        }
    }
    return text;
}

int script_log(lua_State* L, spdlog::level::level_enum level) {
    spdlog::log(level, "[topology] {}", script_message(L));
    return 0;
}

} // namespace

int l_LOG(lua_State* L) { return script_log(L, spdlog::level::info); }
int l_WARN(lua_State* L) { return script_log(L, spdlog::level::warn); }
int l_SPEW(lua_State* L) { return script_log(L, spdlog::level::debug); }

} // namespace wg::log
