#pragma once
// ProcessEngine.h
//
// Public integration surface of the worker host.
//
// Owns the event loop, the Lua VM, the host context (process registry + ports) and the server
// directory. Starts processes, dispatches them to the execution mode matching their format,
// tears them down exactly once and routes every completion through one pipeline.
//
// Start flow (StartProcess):
//   allocate pid -> admit RAM -> register -> list on server -> dispatch to driver
// Any rejection returns InvalidProcessId and leaves registry, RAM and server list untouched.
//
// Teardown (kill, crash, finish) - at most once per process:
//   stop flag + running=false, unregister, release RAM, drop from server list, release the Lua
//   thread when it is not executing, notify process-list listeners.
//
// Single-threaded: everything runs from Tick()/RunUntilIdle() or from the caller's thread.

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Capability.h"
#include "EventLoop.h"
#include "HostContext.h"
#include "ProcessDriver.h"
#include "Server.h"
#include "Settings/HostSettings.hpp"
#include "WorkerScript.h"

namespace WorkerHost {

    class ScriptVM;

    // Interface for user-facing notices (crash dialogs, RAM rejections, tprint).
    class IUserNotifier {
    public:
        virtual ~IUserNotifier() = default;
        virtual void Notify(const std::string& message) = 0;
        virtual void Terminal(const std::string& line) = 0;
    };

    // Default notifier routes to the host log.
    class DefaultNotifier : public IUserNotifier {
    public:
        void Notify(const std::string& message) override;
        void Terminal(const std::string& line) override;
    };

    class ProcessEngine {
    public:
        using ProcessListListener = std::function<void()>;
        using OfflineProductionFn = std::function<void(RunningScript&, Server&)>;

        explicit ProcessEngine(const HostSettingsData& settings = HostSettingsData{},
                               std::shared_ptr<IUserNotifier> notifier = nullptr);
        ~ProcessEngine();
        ProcessEngine(const ProcessEngine&) = delete;
        ProcessEngine& operator=(const ProcessEngine&) = delete;

        // --- servers
        void AddServer(ServerPtr server);
        Server* FindServer(const std::string& hostname) const;
        const std::vector<ServerPtr>& Servers() const { return m_servers; }

        // --- collaborators
        void SetGameFunctions(std::shared_ptr<IGameFunctions> game) { m_game = std::move(game); }
        bool HasGameFunctions() const { return m_game != nullptr; }
        void SetNotifier(std::shared_ptr<IUserNotifier> notifier);
        void AddProcessListListener(ProcessListListener listener);

        // --- process lifecycle
        ProcessId StartProcess(std::shared_ptr<RunningScript> script, Server& server,
                               std::optional<ProcessId> parentPid = std::nullopt);

        // Launch on behalf of a running script (run/exec). Validation failures log to the caller
        // and return InvalidProcessId.
        ProcessId StartNestedProcess(WorkerScript& caller, Server& server, const Value& scriptName,
                                     const Value& args, double threads = 1.0,
                                     const std::string& callingFunction = "run");

        bool KillProcess(ProcessId pid);
        void KillAll();
        // KillAll + ports and pid counter back to their initial state.
        void Prestige();

        // Restart every persisted running script. Scripts that cannot be admitted are dropped
        // from their server. offline (optional) runs once per restarted script.
        void RehydrateFromPersisted(const std::vector<ServerPtr>& servers, OfflineProductionFn offline = nullptr);

        void UpdateOnlineScriptTimes(int numCycles = 1);

        WorkerScriptPtr GetProcess(ProcessId pid) const { return m_context.Registry().Lookup(pid); }
        std::vector<WorkerScriptPtr> LiveProcesses() const { return m_context.Registry().AllLive(); }

        // --- scheduling
        void Tick(int64_t dtMs) { m_loop.Tick(dtMs); }
        bool RunUntilIdle(int64_t maxMs) { return m_loop.RunUntilIdle(maxMs); }

        EventLoop& Loop() { return m_loop; }
        HostContext& Context() { return m_context; }
        const HostSettingsData& Settings() const { return m_settings; }
        std::weak_ptr<ScriptVM> VM() const { return m_vm; }

        // --- used by the execution modes
        HostCallResult InvokeCapability(WorkerScript& ws, Capability capability, const ValueList& args);
        void OnProcessSettled(const WorkerScriptPtr& ws, const ProcessCompletion& completion);
        bool Teardown(WorkerScript& ws);
        void NotifyUser(const std::string& message);

    private:
        bool CreateAndAddWorkerScript(const std::shared_ptr<RunningScript>& script, Server& server,
                                      std::optional<ProcessId> parentPid, bool addToServer);

        void HandleSuccess(WorkerScript& ws);
        void HandleFailure(WorkerScript& ws, const TerminationReason& reason);
        void EmitProcessListChanged();

        HostCallResult Sleep(WorkerScript& ws, const ValueList& args);
        HostCallResult Run(WorkerScript& ws, const ValueList& args);
        HostCallResult Exec(WorkerScript& ws, const ValueList& args);
        HostCallResult Exit(WorkerScript& ws);
        MessagePort& RequirePort(const ValueList& args, const char* function);

        HostSettingsData m_settings;
        EventLoop m_loop;
        std::shared_ptr<ScriptVM> m_vm;
        HostContext m_context;
        std::vector<ServerPtr> m_servers;
        std::shared_ptr<IGameFunctions> m_game;
        std::shared_ptr<IUserNotifier> m_notifier;
        std::vector<ProcessListListener> m_listeners;
    };

} // namespace WorkerHost
