#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string_view>

struct lua_State;

namespace wg::lua {

/// RAII wrapper around a Lua 5.0 state. Only the base, table, string and
/// math libraries are opened: topology files are data, not programs with
/// file or OS access.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code);

    /// Execute a file from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

private:
    Result<void> run_chunk(int load_status);

    lua_State* L_ = nullptr;
};

} // namespace wg::lua
