#pragma once
// ScriptUtils.h
// Small cross-cutting helpers for Lua <-> host Value conversions.
// - RAII stack guard for lua_State.
// - Value push/read: arrays become sequences (1-based), objects become string-keyed tables.
//   Functions, threads and userdata read back as Nil. Cyclic tables are cut at the repeat.

#include <string>

extern "C" {
#include "lua.h"
#include "lauxlib.h"
#include "lualib.h"
}

#include "Value.h"

namespace WorkerHost {

    // RAII guard that restores Lua stack top when destroyed.
    // Usage:
    //    LuaStackGuard g(L);
    //    // push/pop freely
    //    // on exit stack is restored
    struct LuaStackGuard {
        lua_State* L = nullptr;
        int top = 0;
        LuaStackGuard(lua_State* L_) : L(L_), top(L_ ? lua_gettop(L_) : 0) {}
        ~LuaStackGuard() { if (L) lua_settop(L, top); }
        LuaStackGuard(const LuaStackGuard&) = delete;
        LuaStackGuard& operator=(const LuaStackGuard&) = delete;
    };

    void PushValue(lua_State* L, const Value& value);
    Value ToValue(lua_State* L, int idx);

    // Values at stack positions [first, top].
    ValueList CollectArgs(lua_State* L, int first);

    bool GetStringSafe(lua_State* L, int idx, std::string& out);

} // namespace WorkerHost
