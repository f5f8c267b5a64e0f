#pragma once
// WorkerScript.h
//
// Live process state for one running script: identity, backing RunningScript record, host server,
// environment stop flag, error slot, in-flight host call (native mode), awaited promise and the
// Lua thread that executes it.
//
// Owned through shared_ptr by the process registry and by the execution driver. Teardown happens
// exactly once (MarkTornDown), the completion outcome is recorded once (SetOutcome).

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "ScriptError.h"
#include "ScriptPromise.h"
#include "RunningScript.h"
#include "WorkerHostTypes.h"

namespace WorkerHost {

    class Server;
    class ScriptThread;

    struct ProcessEnvironment {
        bool stopFlag = false;
    };

    class WorkerScript : public std::enable_shared_from_this<WorkerScript> {
    public:
        WorkerScript(ProcessId pid, std::shared_ptr<RunningScript> script, Server& server, std::string code,
                     std::optional<ProcessId> parentPid, size_t maxLogCapacity);
        ~WorkerScript();

        ProcessId Pid() const { return m_pid; }
        const std::string& Name() const { return m_script->filename; }
        const ValueList& Args() const { return m_script->args; }
        const std::string& Code() const { return m_code; }
        ScriptFormat Format() const { return m_format; }

        RunningScript& ScriptRef() { return *m_script; }
        const RunningScript& ScriptRef() const { return *m_script; }
        const std::shared_ptr<RunningScript>& SharedScriptRef() const { return m_script; }

        Server& GetServer() const { return m_server; }
        std::optional<ProcessId> ParentPid() const { return m_parentPid; }
        // The exact parent process; empty once it is gone, even if its pid was reused.
        std::shared_ptr<WorkerScript> Parent() const { return m_parent.lock(); }
        void SetParent(std::weak_ptr<WorkerScript> parent) { m_parent = std::move(parent); }

        ProcessEnvironment& Env() { return m_env; }
        const ProcessEnvironment& Env() const { return m_env; }

        bool IsRunning() const { return m_running; }
        void SetRunning(bool running) { m_running = running; }

        double RamUsage() const { return m_ramUsage; }
        void SetRamUsage(double ram) { m_ramUsage = ram; }

        // Error slot, filled by the call serializer on a concurrency violation.
        bool HasError() const { return m_error.has_value(); }
        const std::optional<TerminationReason>& Error() const { return m_error; }
        void SetError(TerminationReason reason) { m_error = std::move(reason); }

        // "caller: message" into the script's log, also echoed at debug level to the host log.
        void Log(const std::string& caller, const std::string& message);
        const std::deque<std::string>& Logs() const { return m_script->logs; }

        // Name of the host call in flight (native mode). Empty when idle.
        const std::string& InFlightCall() const { return m_inFlightCall; }
        void SetInFlightCall(const std::string& name) { m_inFlightCall = name; }
        void ClearInFlightCall() { m_inFlightCall.clear(); }

        // Promise the Lua thread yielded on, collected by the driver after the resume returns.
        void SetPendingPromise(PromisePtr promise) { m_pendingPromise = std::move(promise); }
        PromisePtr TakePendingPromise();

        ProcessOutcome Outcome() const { return m_outcome; }
        // Returns false if an outcome was already recorded.
        bool SetOutcome(ProcessOutcome outcome);

        // Returns false when teardown already happened.
        bool MarkTornDown();
        bool IsTornDown() const { return m_tornDown; }

        ScriptThread* Thread() const { return m_thread.get(); }
        void AttachThread(std::unique_ptr<ScriptThread> thread);

        // Line offset introduced by import inlining.
        int LineOffset() const { return m_lineOffset; }
        void SetLineOffset(int offset) { m_lineOffset = offset; }

        // Invoked once when the process is torn down, so the driver can settle it early.
        void SetStopHandler(std::function<void()> handler) { m_stopHandler = std::move(handler); }
        void NotifyStopped();

    private:
        ProcessId m_pid;
        std::shared_ptr<RunningScript> m_script;
        Server& m_server;
        std::string m_code;
        ScriptFormat m_format;
        std::optional<ProcessId> m_parentPid;
        std::weak_ptr<WorkerScript> m_parent;
        size_t m_maxLogCapacity;

        ProcessEnvironment m_env;
        bool m_running = false;
        double m_ramUsage = 0.0;
        std::optional<TerminationReason> m_error;
        std::string m_inFlightCall;
        PromisePtr m_pendingPromise;
        ProcessOutcome m_outcome = ProcessOutcome::Running;
        bool m_tornDown = false;
        int m_lineOffset = 0;

        std::unique_ptr<ScriptThread> m_thread;
        std::function<void()> m_stopHandler;
    };

    using WorkerScriptPtr = std::shared_ptr<WorkerScript>;

} // namespace WorkerHost
