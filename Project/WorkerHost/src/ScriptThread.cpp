// ScriptThread.cpp
#include "ScriptThread.h"
#include "ScriptUtils.h"
#include "Logging.hpp"

extern "C" {
#include "lua.h"
#include "lauxlib.h"
#include "lualib.h"
}

#include <cstring>

#if !defined(LUA_VERSION_NUM) || LUA_VERSION_NUM < 504
#error "WorkerHost requires Lua 5.4 (lua_resume with nresults, lua_getextraspace)"
#endif

namespace WorkerHost {

    namespace {
        WorkerScript*& OwnerSlot(lua_State* L) {
            return *static_cast<WorkerScript**>(lua_getextraspace(L));
        }

        void StepHook(lua_State* L, lua_Debug* ar) {
            if (ar->event != LUA_HOOKCOUNT) return;
            // Only the process coroutine itself is stepped; guest-created coroutines run through.
            if (OwnerSlot(L) == nullptr || !lua_isyieldable(L)) return;
            lua_yield(L, 0);
        }

        // Guest scripts get no file, OS or module access.
        const luaL_Reg kLibraries[] = {
            { LUA_GNAME, luaopen_base },
            { LUA_COLIBNAME, luaopen_coroutine },
            { LUA_TABLIBNAME, luaopen_table },
            { LUA_STRLIBNAME, luaopen_string },
            { LUA_MATHLIBNAME, luaopen_math },
            { LUA_UTF8LIBNAME, luaopen_utf8 },
            { nullptr, nullptr }
        };

        const char* const kRemovedGlobals[] = { "dofile", "loadfile", "load", "collectgarbage" };
    }

    // ---------------------------------------------------------------- ScriptVM

    ScriptVM::ScriptVM() {
        m_L = luaL_newstate();
        if (!m_L) {
            HOST_LOG_CRITICAL("[ScriptVM] luaL_newstate failed");
            return;
        }
        OwnerSlot(m_L) = nullptr;

        for (const luaL_Reg* lib = kLibraries; lib->func; ++lib) {
            luaL_requiref(m_L, lib->name, lib->func, 1);
            lua_pop(m_L, 1);
        }
        for (const char* name : kRemovedGlobals) {
            lua_pushnil(m_L);
            lua_setglobal(m_L, name);
        }
    }

    ScriptVM::~ScriptVM() {
        if (m_L) {
            lua_close(m_L);
            m_L = nullptr;
        }
    }

    // ---------------------------------------------------------------- ScriptThread

    ScriptThread::ScriptThread(std::weak_ptr<ScriptVM> vm)
        : m_vm(std::move(vm)), m_threadRef(LUA_NOREF), m_envRef(LUA_NOREF) {}

    ScriptThread::~ScriptThread() {
        if (!m_executing) Release();
    }

    lua_State* ScriptThread::MainState() const {
        auto vm = m_vm.lock();
        return vm ? vm->State() : nullptr;
    }

    bool ScriptThread::Load(const std::string& code, const std::string& chunkName, WorkerScript* owner, std::string& error) {
        auto vm = m_vm.lock();
        if (!vm || !vm->State()) {
            error = "script VM is not available";
            return false;
        }
        if (m_co || m_released) {
            error = "script thread already loaded";
            return false;
        }

        lua_State* L = vm->State();
        LuaStackGuard guard(L);

        const std::string chunk = "=" + chunkName;
        int status = luaL_loadbufferx(L, code.data(), code.size(), chunk.c_str(), "t");
        if (status != LUA_OK) {
            const char* msg = lua_tostring(L, -1);
            error = msg ? msg : "unknown compile error";
            return false;
        }

        // Environment: own table, reads fall back to the VM globals.
        lua_newtable(L);
        lua_newtable(L);
        lua_pushglobaltable(L);
        lua_setfield(L, -2, "__index");
        lua_setmetatable(L, -2);
        lua_pushvalue(L, -1);
        m_envRef = luaL_ref(L, LUA_REGISTRYINDEX);
        // main chunk's first upvalue is _ENV
        if (!lua_setupvalue(L, -2, 1)) {
            lua_pop(L, 1);
        }

        lua_State* co = lua_newthread(L);
        m_threadRef = luaL_ref(L, LUA_REGISTRYINDEX);
        lua_xmove(L, co, 1); // compiled chunk becomes the coroutine body
        OwnerSlot(co) = owner;

        m_co = co;
        return true;
    }

    void ScriptThread::PushEnvironment(lua_State* L) const {
        if (m_envRef == LUA_NOREF || m_envRef == LUA_REFNIL) {
            lua_pushnil(L);
            return;
        }
        lua_rawgeti(L, LUA_REGISTRYINDEX, m_envRef);
    }

    void ScriptThread::SetInstructionBudget(int count) {
        if (!m_co) return;
        if (count <= 0) {
            lua_sethook(m_co, nullptr, 0, 0);
            return;
        }
        lua_sethook(m_co, StepHook, LUA_MASKCOUNT, count);
    }

    ResumeResult ScriptThread::Resume(int nargs) {
        ResumeResult result;
        lua_State* L = MainState();
        if (!m_co || !L) {
            result.status = ResumeStatus::Finished;
            return result;
        }

        m_executing = true;
        int nres = 0;
        int status = lua_resume(m_co, L, nargs, &nres);
        m_executing = false;

        if (status == LUA_YIELD) {
            lua_pop(m_co, nres);
            result.status = ResumeStatus::Yielded;
        }
        else if (status == LUA_OK) {
            lua_settop(m_co, 0);
            result.status = ResumeStatus::Finished;
        }
        else {
            result.status = ResumeStatus::Errored;
            result.errorCode = status;
        }
        return result;
    }

    void ScriptThread::Release() {
        if (m_released) return;
        m_released = true;

        auto vm = m_vm.lock();
        if (!vm || !vm->State()) {
            m_co = nullptr;
            return;
        }
        lua_State* L = vm->State();
        if (m_co) {
            OwnerSlot(m_co) = nullptr;
            lua_sethook(m_co, nullptr, 0, 0);
        }
        if (m_threadRef != LUA_NOREF) {
            luaL_unref(L, LUA_REGISTRYINDEX, m_threadRef);
            m_threadRef = LUA_NOREF;
        }
        if (m_envRef != LUA_NOREF) {
            luaL_unref(L, LUA_REGISTRYINDEX, m_envRef);
            m_envRef = LUA_NOREF;
        }
        m_co = nullptr;
    }

    WorkerScript* ScriptThread::OwnerOf(lua_State* L) {
        if (!L) return nullptr;
        return OwnerSlot(L);
    }

} // namespace WorkerHost
