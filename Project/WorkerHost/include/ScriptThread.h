#pragma once
// ScriptThread.h
//
// Lua side of a worker script.
//
//   ScriptVM      owns the shared lua_State (standard libraries minus file/OS access, promise type).
//   ScriptThread  one coroutine per process, running the compiled script inside its own
//                 environment table (reads fall through to the VM globals, writes stay local).
//
// The owning WorkerScript is stored in the coroutine's extra space so host functions can find
// the process that called them. Coroutines created by guest code carry no owner.
//
// Threads hold only a weak reference to the VM: once the VM is gone, Release() is a no-op.
//
// Stack discipline: every helper leaves the main state's stack as it found it.

#include <cstdint>
#include <memory>
#include <string>

extern "C" {
    struct lua_State;
}

namespace WorkerHost {

    class WorkerScript;

    class ScriptVM {
    public:
        ScriptVM();
        ~ScriptVM();
        ScriptVM(const ScriptVM&) = delete;
        ScriptVM& operator=(const ScriptVM&) = delete;

        lua_State* State() const { return m_L; }

    private:
        lua_State* m_L = nullptr;
    };

    enum class ResumeStatus : uint8_t {
        Yielded = 0,
        Finished,
        Errored
    };

    struct ResumeResult {
        ResumeStatus status = ResumeStatus::Finished;
        int errorCode = 0; // lua status code when Errored; error object left on the coroutine stack
    };

    class ScriptThread {
    public:
        explicit ScriptThread(std::weak_ptr<ScriptVM> vm);
        ~ScriptThread();
        ScriptThread(const ScriptThread&) = delete;
        ScriptThread& operator=(const ScriptThread&) = delete;

        // Compile code as chunk "=<chunkName>" into a fresh environment and coroutine.
        // On failure returns false and fills error with the compiler message.
        bool Load(const std::string& code, const std::string& chunkName, WorkerScript* owner, std::string& error);

        bool IsLoaded() const { return m_co != nullptr; }
        lua_State* Coroutine() const { return m_co; }
        // Main state of the VM, nullptr once the VM is gone.
        lua_State* MainState() const;

        // Pushes the environment table onto L.
        void PushEnvironment(lua_State* L) const;

        // Yield the coroutine every 'count' VM instructions (legacy stepping).
        void SetInstructionBudget(int count);

        // Resume with nargs values already pushed on Coroutine().
        ResumeResult Resume(int nargs);
        bool IsExecuting() const { return m_executing; }

        // Drop the registry references. Idempotent. Must not be called while executing.
        void Release();
        bool IsReleased() const { return m_released; }

        // Process that owns the running coroutine L, or nullptr.
        static WorkerScript* OwnerOf(lua_State* L);

    private:
        std::weak_ptr<ScriptVM> m_vm;
        lua_State* m_co = nullptr;
        int m_threadRef;
        int m_envRef;
        bool m_executing = false;
        bool m_released = false;
    };

} // namespace WorkerHost
