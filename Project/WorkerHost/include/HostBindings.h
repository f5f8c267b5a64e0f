#pragma once
// HostBindings.h
//
// Lua glue between guest scripts and host capabilities.
//
// Install() binds every capability (game capabilities only when a provider is present) plus the
// 'args' array into a process environment. The binding style depends on the script format:
//
//   Legacy  action capabilities block: the coroutine yields on the host promise and resumes with
//           its value, or raises its rejection reason as a guest error.
//   Native  every call goes through the CallSerializer; actions return a promise object that the
//           guest waits on with await(p) or p:await().
//
// A stop request unwinds the guest with a private sentinel error object (IsStopSignal).
// No C++ exception crosses a Lua frame: bindings convert them to Lua errors.

#include "ScriptPromise.h"

extern "C" {
    struct lua_State;
}

namespace WorkerHost {

    class ProcessEngine;
    class WorkerScript;

    namespace HostBindings {

        // Promise metatable. Idempotent, call once per VM.
        void RegisterTypes(lua_State* L);

        void Install(lua_State* L, int envIndex, ProcessEngine& engine, WorkerScript& ws, bool includeGameFunctions);

        void PushPromise(lua_State* L, PromisePtr promise);
        // nullptr if the value at idx is not a promise object.
        PromisePtr ToPromise(lua_State* L, int idx);

        void PushStopSignal(lua_State* L);
        bool IsStopSignal(lua_State* L, int idx);

    } // namespace HostBindings
} // namespace WorkerHost
