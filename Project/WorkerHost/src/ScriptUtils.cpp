// ScriptUtils.cpp
#include "ScriptUtils.h"

#include <cmath>
#include <unordered_set>

namespace WorkerHost {

    namespace {
        constexpr int kMaxDepth = 32;

        void PushValueImpl(lua_State* L, const Value& value, int depth) {
            luaL_checkstack(L, 3, "value too deeply nested");
            switch (value.GetType()) {
            case Value::Type::Nil:
                lua_pushnil(L);
                break;
            case Value::Type::Boolean:
                lua_pushboolean(L, value.AsBool() ? 1 : 0);
                break;
            case Value::Type::Number: {
                double n = value.AsNumber();
                if (std::floor(n) == n && std::fabs(n) < 9007199254740992.0) {
                    lua_pushinteger(L, static_cast<lua_Integer>(n));
                }
                else {
                    lua_pushnumber(L, static_cast<lua_Number>(n));
                }
                break;
            }
            case Value::Type::String:
                lua_pushlstring(L, value.AsString().c_str(), value.AsString().size());
                break;
            case Value::Type::Array: {
                const auto& items = value.Items();
                lua_createtable(L, static_cast<int>(items.size()), 0);
                if (depth >= kMaxDepth) break;
                for (size_t i = 0; i < items.size(); ++i) {
                    PushValueImpl(L, items[i], depth + 1);
                    lua_rawseti(L, -2, static_cast<lua_Integer>(i + 1));
                }
                break;
            }
            case Value::Type::Object: {
                const auto& keys = value.Keys();
                const auto& items = value.Items();
                lua_createtable(L, 0, static_cast<int>(keys.size()));
                if (depth >= kMaxDepth) break;
                for (size_t i = 0; i < keys.size(); ++i) {
                    lua_pushlstring(L, keys[i].c_str(), keys[i].size());
                    PushValueImpl(L, items[i], depth + 1);
                    lua_rawset(L, -3);
                }
                break;
            }
            }
        }

        std::string KeyToString(lua_State* L, int idx) {
            if (lua_type(L, idx) == LUA_TSTRING) {
                size_t len = 0;
                const char* s = lua_tolstring(L, idx, &len);
                return std::string(s, len);
            }
            // numbers: format without touching the key in place (lua_next relies on it)
            return Value(static_cast<double>(lua_tonumber(L, idx))).ToDisplayString();
        }

        Value ToValueImpl(lua_State* L, int idx, int depth, std::unordered_set<const void*>& visiting) {
            idx = lua_absindex(L, idx);
            switch (lua_type(L, idx)) {
            case LUA_TBOOLEAN:
                return Value(lua_toboolean(L, idx) != 0);
            case LUA_TNUMBER:
                return Value(static_cast<double>(lua_tonumber(L, idx)));
            case LUA_TSTRING: {
                size_t len = 0;
                const char* s = lua_tolstring(L, idx, &len);
                return Value(std::string(s, len));
            }
            case LUA_TTABLE:
                break;
            default:
                return Value();
            }

            const void* ptr = lua_topointer(L, idx);
            if (depth >= kMaxDepth || visiting.count(ptr)) {
                return Value();
            }
            visiting.insert(ptr);
            luaL_checkstack(L, 3, "table too deeply nested");

            // Sequence iff every key is an integer 1..n with n == raw length.
            lua_Integer len = static_cast<lua_Integer>(lua_rawlen(L, idx));
            lua_Integer keyCount = 0;
            bool isArray = true;
            lua_pushnil(L);
            while (lua_next(L, idx) != 0) {
                ++keyCount;
                if (!lua_isinteger(L, -2)) {
                    isArray = false;
                }
                else {
                    lua_Integer k = lua_tointeger(L, -2);
                    if (k < 1 || k > len) isArray = false;
                }
                lua_pop(L, 1);
            }
            if (keyCount != len) isArray = false;

            Value result;
            if (isArray) {
                result = Value::MakeArray();
                for (lua_Integer i = 1; i <= len; ++i) {
                    lua_rawgeti(L, idx, i);
                    result.Push(ToValueImpl(L, -1, depth + 1, visiting));
                    lua_pop(L, 1);
                }
            }
            else {
                result = Value::MakeObject();
                lua_pushnil(L);
                while (lua_next(L, idx) != 0) {
                    int keyType = lua_type(L, -2);
                    if (keyType == LUA_TSTRING || keyType == LUA_TNUMBER) {
                        result.Set(KeyToString(L, -2), ToValueImpl(L, -1, depth + 1, visiting));
                    }
                    lua_pop(L, 1);
                }
            }

            visiting.erase(ptr);
            return result;
        }
    }

    void PushValue(lua_State* L, const Value& value) {
        if (!L) return;
        PushValueImpl(L, value, 0);
    }

    Value ToValue(lua_State* L, int idx) {
        if (!L) return Value();
        std::unordered_set<const void*> visiting;
        return ToValueImpl(L, idx, 0, visiting);
    }

    ValueList CollectArgs(lua_State* L, int first) {
        ValueList out;
        int top = lua_gettop(L);
        for (int i = first; i <= top; ++i) {
            out.push_back(ToValue(L, i));
        }
        return out;
    }

    bool GetStringSafe(lua_State* L, int idx, std::string& out) {
        if (!L) return false;
        if (!lua_isstring(L, idx)) return false;
        size_t len = 0;
        const char* s = lua_tolstring(L, idx, &len);
        if (!s) return false;
        out.assign(s, len);
        return true;
    }

} // namespace WorkerHost
