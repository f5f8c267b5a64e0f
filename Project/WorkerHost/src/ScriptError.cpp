// ScriptError.cpp
//
// Runtime error message construction/parsing and Lua error formatting.

#include "ScriptError.h"
#include "Logging.hpp"

extern "C" {
#include "lua.h"
#include "lauxlib.h"
}

#include <cctype>
#include <sstream>
#include <vector>

namespace WorkerHost {

    std::string DescribeReason(const TerminationReason& reason) {
        if (std::holds_alternative<AlreadyTerminated>(reason)) {
            return "already terminated";
        }
        if (const auto* msg = std::get_if<RuntimeErrorMessage>(&reason)) {
            return "runtime error: " + msg->text;
        }
        if (const auto* fault = std::get_if<NativeFault>(&reason)) {
            return "native fault: " + fault->what;
        }
        if (const auto* other = std::get_if<Unrecognized>(&reason)) {
            return "unrecognized: " + other->description;
        }
        return "unknown";
    }

    namespace Error {

        const char* const RuntimeErrorTag = "RUNTIME_ERROR";

        static std::string SanitizeField(const std::string& field) {
            std::string out = field;
            for (char& c : out) {
                if (c == '|') c = '/';
            }
            return out;
        }

        static std::vector<std::string> SplitFields(const std::string& text) {
            std::vector<std::string> fields;
            size_t start = 0;
            while (true) {
                size_t bar = text.find('|', start);
                if (bar == std::string::npos) {
                    fields.push_back(text.substr(start));
                    break;
                }
                fields.push_back(text.substr(start, bar - start));
                start = bar + 1;
            }
            return fields;
        }

        std::string MakeRuntimeErrorMessage(const std::string& hostname, const std::string& scriptName, const std::string& message) {
            std::string out = RuntimeErrorTag;
            out += "|" + SanitizeField(hostname);
            out += "|" + SanitizeField(scriptName);
            out += "|" + SanitizeField(message);
            return out;
        }

        bool IsRuntimeErrorMessage(const std::string& text) {
            return ParseRuntimeErrorMessage(text).has_value();
        }

        std::optional<RuntimeErrorFields> ParseRuntimeErrorMessage(const std::string& text) {
            std::vector<std::string> fields = SplitFields(text);
            if (fields.size() != 4 || fields[0] != RuntimeErrorTag) {
                return std::nullopt;
            }
            return RuntimeErrorFields{ fields[1], fields[2], fields[3] };
        }

        namespace {
            constexpr int kToStringInstructionBudget = 100000;

            void ToStringBudgetHook(lua_State* L, lua_Debug* ar) {
                (void)ar;
                luaL_error(L, "'__tostring' exceeded its instruction budget");
            }

            int ToStringThunk(lua_State* L) {
                luaL_tolstring(L, 1, nullptr);
                return 1;
            }
        }

        bool ProtectedToString(lua_State* L, int index, std::string& out) {
            if (!L) return false;
            index = lua_absindex(L, index);

            const int type = lua_type(L, index);
            if (type == LUA_TSTRING || type == LUA_TNUMBER) {
                // lua_tolstring converts numbers in place; work on a copy
                lua_pushvalue(L, index);
                size_t len = 0;
                const char* s = lua_tolstring(L, -1, &len);
                if (s) out.assign(s, len);
                lua_pop(L, 1);
                return s != nullptr;
            }

            // Guest metamethods run on a scratch thread so a raise, a bad return value or an
            // endless loop ends in a failed pcall instead of a panic.
            const int top = lua_gettop(L);
            lua_State* scratch = lua_newthread(L);
            lua_sethook(scratch, ToStringBudgetHook, LUA_MASKCOUNT, kToStringInstructionBudget);
            lua_pushcfunction(scratch, ToStringThunk);
            lua_pushvalue(L, index);
            lua_xmove(L, scratch, 1);

            bool ok = lua_pcall(scratch, 1, 1, 0) == LUA_OK;
            if (ok) {
                size_t len = 0;
                const char* s = lua_tolstring(scratch, -1, &len);
                ok = s != nullptr;
                if (ok) out.assign(s, len);
            }
            lua_settop(L, top);
            return ok;
        }

        static void SafeToString(lua_State* L, int index, std::string& out) {
            if (!ProtectedToString(L, index, out)) {
                out = std::string("(error object is a ") + luaL_typename(L, index) + " value)";
            }
        }

        std::string FormatLuaError(lua_State* L, int err) {
            if (!L) return std::string("Lua error (null lua_State)");

            int top = lua_gettop(L);
            std::string message;
            if (top > 0) {
                SafeToString(L, top, message);
            }

            luaL_traceback(L, L, message.empty() ? nullptr : message.c_str(), 0);
            const char* tb = lua_tostring(L, -1);
            std::string traceback = tb ? tb : "(no traceback)";

            std::ostringstream oss;
            oss << "Lua error";
            switch (err) {
            case LUA_ERRRUN: oss << " (runtime)"; break;
            case LUA_ERRMEM: oss << " (memory)"; break;
            case LUA_ERRERR: oss << " (error while handling error)"; break;
            case LUA_ERRSYNTAX: oss << " (syntax)"; break;
            default: break;
            }
            oss << ": " << (message.empty() ? std::string("(no message)") : message);
            oss << "\n\nStack traceback:\n" << traceback;

            lua_settop(L, top);
            return oss.str();
        }

        std::string MapErrorPosition(const std::string& message, const std::string& chunkName, int lineOffset) {
            if (lineOffset == 0 || chunkName.empty()) return message;

            const std::string prefix = chunkName + ":";
            std::string out;
            size_t pos = 0;
            while (pos < message.size()) {
                size_t hit = message.find(prefix, pos);
                if (hit == std::string::npos) {
                    out += message.substr(pos);
                    break;
                }
                size_t digitsBegin = hit + prefix.size();
                size_t digitsEnd = digitsBegin;
                while (digitsEnd < message.size() && std::isdigit(static_cast<unsigned char>(message[digitsEnd]))) {
                    ++digitsEnd;
                }
                out += message.substr(pos, digitsBegin - pos);
                if (digitsEnd == digitsBegin || digitsEnd - digitsBegin > 9 ||
                    digitsEnd >= message.size() || message[digitsEnd] != ':') {
                    pos = digitsBegin;
                    continue;
                }

                long line = std::stol(message.substr(digitsBegin, digitsEnd - digitsBegin));
                long mapped = line - lineOffset;
                out += std::to_string(mapped >= 1 ? mapped : line);
                pos = digitsEnd;
            }
            return out;
        }

    } // namespace Error
} // namespace WorkerHost
