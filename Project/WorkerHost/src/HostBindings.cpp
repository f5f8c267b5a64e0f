// HostBindings.cpp
#include "HostBindings.h"
#include "CallSerializer.h"
#include "Capability.h"
#include "ProcessEngine.h"
#include "ScriptThread.h"
#include "ScriptUtils.h"
#include "WorkerScript.h"
#include "Logging.hpp"

extern "C" {
#include "lua.h"
#include "lauxlib.h"
}

#include <cstdio>
#include <new>

namespace WorkerHost {
    namespace HostBindings {

        namespace {
            const char* const kPromiseMeta = "WorkerHost.Promise";
            const char kStopSignalKey = 0;

            // Messages are copied here so no C++ object is alive when lua_error unwinds.
            constexpr size_t kMessageSize = 2048;

            struct PromiseBox {
                PromisePtr promise;
            };

            enum class CallOutcome {
                Value,
                Promise,
                Yield,
                Error,
                Stop
            };

            void CopyMessage(char* buffer, const char* text) {
                std::snprintf(buffer, kMessageSize, "%s", text ? text : "unknown error");
            }

            int Promise_gc(lua_State* L) {
                auto* box = static_cast<PromiseBox*>(luaL_checkudata(L, 1, kPromiseMeta));
                box->~PromiseBox();
                return 0;
            }

            int Promise_tostring(lua_State* L) {
                auto* box = static_cast<PromiseBox*>(luaL_checkudata(L, 1, kPromiseMeta));
                const char* state = "pending";
                if (box->promise && box->promise->IsResolved()) state = "resolved";
                else if (box->promise && box->promise->IsRejected()) state = "rejected";
                lua_pushfstring(L, "Promise<%s>", state);
                return 1;
            }

            // Continuation after a host promise settles: stack top is (ok, value|reason).
            int ResumeAfterPromise(lua_State* L, int status, lua_KContext ctx) {
                (void)status;
                (void)ctx;
                if (!lua_toboolean(L, -2)) {
                    return lua_error(L);
                }
                return 1;
            }

            WorkerScript* CallingProcess(lua_State* L, const char* function) {
                WorkerScript* ws = ScriptThread::OwnerOf(L);
                if (!ws) {
                    luaL_error(L, "%s: host functions can only be called from a script's main thread", function);
                }
                return ws;
            }

            int LegacyCall(lua_State* L) {
                auto* engine = static_cast<ProcessEngine*>(lua_touserdata(L, lua_upvalueindex(1)));
                const auto capability = static_cast<Capability>(lua_tointeger(L, lua_upvalueindex(2)));
                const CapabilityDescriptor& descriptor = Describe(capability);
                WorkerScript* ws = CallingProcess(L, descriptor.name);

                char message[kMessageSize] = { 0 };
                CallOutcome outcome = CallOutcome::Value;
                {
                    try {
                        if (ws->Env().stopFlag) throw StopSignal();
                        ValueList args = CollectArgs(L, 1);
                        HostCallResult result = engine->InvokeCapability(*ws, capability, args);
                        if (result.promise) {
                            ws->SetPendingPromise(result.promise);
                            outcome = CallOutcome::Yield;
                        }
                        else {
                            PushValue(L, result.value);
                        }
                    }
                    catch (const StopSignal&) {
                        outcome = CallOutcome::Stop;
                    }
                    catch (const std::exception& e) {
                        CopyMessage(message, e.what());
                        outcome = CallOutcome::Error;
                    }
                }

                switch (outcome) {
                case CallOutcome::Value:
                case CallOutcome::Promise:
                    return 1;
                case CallOutcome::Yield:
                    return lua_yieldk(L, 0, 0, &ResumeAfterPromise);
                case CallOutcome::Stop:
                    PushStopSignal(L);
                    return lua_error(L);
                case CallOutcome::Error:
                    break;
                }
                lua_pushstring(L, message);
                return lua_error(L);
            }

            int NativeCall(lua_State* L) {
                auto* engine = static_cast<ProcessEngine*>(lua_touserdata(L, lua_upvalueindex(1)));
                const auto capability = static_cast<Capability>(lua_tointeger(L, lua_upvalueindex(2)));
                const CapabilityDescriptor& descriptor = Describe(capability);
                WorkerScript* ws = CallingProcess(L, descriptor.name);

                char message[kMessageSize] = { 0 };
                CallOutcome outcome = CallOutcome::Value;
                {
                    try {
                        ValueList args = CollectArgs(L, 1);
                        CallSerializer serializer(*ws);
                        HostCallResult result = serializer.Invoke(descriptor, [&]() {
                            return engine->InvokeCapability(*ws, capability, args);
                        });
                        if (result.promise) {
                            PushPromise(L, result.promise);
                            outcome = CallOutcome::Promise;
                        }
                        else {
                            PushValue(L, result.value);
                        }
                    }
                    catch (const StopSignal&) {
                        outcome = CallOutcome::Stop;
                    }
                    catch (const std::exception& e) {
                        CopyMessage(message, e.what());
                        outcome = CallOutcome::Error;
                    }
                }

                switch (outcome) {
                case CallOutcome::Value:
                case CallOutcome::Promise:
                    return 1;
                case CallOutcome::Stop:
                    PushStopSignal(L);
                    return lua_error(L);
                case CallOutcome::Yield:
                case CallOutcome::Error:
                    break;
                }
                lua_pushstring(L, message);
                return lua_error(L);
            }

            // await(p) / p:await(): suspends until p settles. Non-promise values pass through.
            int NativeAwait(lua_State* L) {
                WorkerScript* ws = CallingProcess(L, "await");
                {
                    PromisePtr promise = ToPromise(L, 1);
                    if (!promise) {
                        lua_settop(L, 1);
                        return 1;
                    }
                    if (!ws->Env().stopFlag) {
                        ws->SetPendingPromise(std::move(promise));
                    }
                }
                if (ws->Env().stopFlag) {
                    PushStopSignal(L);
                    return lua_error(L);
                }
                // Always goes through the loop, even for a settled promise, so pending
                // settlement callbacks (in-flight bookkeeping) run first.
                return lua_yieldk(L, 0, 0, &ResumeAfterPromise);
            }
        }

        void RegisterTypes(lua_State* L) {
            if (luaL_newmetatable(L, kPromiseMeta)) {
                lua_pushcfunction(L, Promise_gc);
                lua_setfield(L, -2, "__gc");
                lua_pushcfunction(L, Promise_tostring);
                lua_setfield(L, -2, "__tostring");
                lua_newtable(L);
                lua_pushcfunction(L, NativeAwait);
                lua_setfield(L, -2, "await");
                lua_setfield(L, -2, "__index");
            }
            lua_pop(L, 1);
        }

        void Install(lua_State* L, int envIndex, ProcessEngine& engine, WorkerScript& ws, bool includeGameFunctions) {
            envIndex = lua_absindex(L, envIndex);
            const bool native = ws.Format() == ScriptFormat::Native;

            for (const auto& descriptor : AllCapabilities()) {
                if (descriptor.provider == CapabilityProvider::Game && !includeGameFunctions) continue;
                lua_pushlightuserdata(L, &engine);
                lua_pushinteger(L, static_cast<lua_Integer>(descriptor.id));
                lua_pushcclosure(L, native ? NativeCall : LegacyCall, 2);
                lua_setfield(L, envIndex, descriptor.name);
            }

            if (native) {
                lua_pushcfunction(L, NativeAwait);
                lua_setfield(L, envIndex, "await");
            }

            PushValue(L, Value::MakeArray(ws.Args()));
            lua_setfield(L, envIndex, "args");
        }

        void PushPromise(lua_State* L, PromisePtr promise) {
            void* memory = lua_newuserdatauv(L, sizeof(PromiseBox), 0);
            new (memory) PromiseBox{ std::move(promise) };
            luaL_setmetatable(L, kPromiseMeta);
        }

        PromisePtr ToPromise(lua_State* L, int idx) {
            auto* box = static_cast<PromiseBox*>(luaL_testudata(L, idx, kPromiseMeta));
            return box ? box->promise : nullptr;
        }

        void PushStopSignal(lua_State* L) {
            lua_pushlightuserdata(L, const_cast<char*>(&kStopSignalKey));
        }

        bool IsStopSignal(lua_State* L, int idx) {
            return lua_type(L, idx) == LUA_TLIGHTUSERDATA && lua_touserdata(L, idx) == &kStopSignalKey;
        }

    } // namespace HostBindings
} // namespace WorkerHost
