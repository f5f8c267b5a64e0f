// ProcessEngine.cpp
//
// Process start surface, kill/prestige/rehydrate and the engine-provided host functions.
// Completion handling and teardown live in CompletionPipeline.cpp.

#include "ProcessEngine.h"
#include "AdmissionController.h"
#include "HostBindings.h"
#include "ScriptThread.h"
#include "Logging.hpp"

#include <algorithm>
#include <cmath>

namespace WorkerHost {

    // ---------------------------------------------------------------- DefaultNotifier

    void DefaultNotifier::Notify(const std::string& message) {
        HOST_LOG_WARN("[Notice] " + message);
    }

    void DefaultNotifier::Terminal(const std::string& line) {
        HOST_PRINT(HostLogging::LogLevel::Info, line);
    }

    // ---------------------------------------------------------------- ProcessEngine

    ProcessEngine::ProcessEngine(const HostSettingsData& settings, std::shared_ptr<IUserNotifier> notifier)
        : m_settings(settings),
          m_vm(std::make_shared<ScriptVM>()),
          m_context(settings),
          m_notifier(notifier ? std::move(notifier) : std::make_shared<DefaultNotifier>()) {
        if (m_vm->State()) {
            HostBindings::RegisterTypes(m_vm->State());
        }
        HOST_PRINT(HostLogging::LogLevel::Info, "[ProcessEngine] ready (", m_settings.instructionsPerStep,
                   " instructions per step, ", m_settings.instructionTimeSliceMs, "ms slice, ",
                   m_context.PortCount(), " ports)");
    }

    ProcessEngine::~ProcessEngine() {
        // Drop scheduled work and live processes while the VM can still release their threads.
        m_loop.Clear();
        m_context.Registry().Clear();
    }

    void ProcessEngine::AddServer(ServerPtr server) {
        if (!server) return;
        if (FindServer(server->Hostname())) {
            HOST_PRINT(HostLogging::LogLevel::Warn, "[ProcessEngine] server '", server->Hostname(), "' already known");
            return;
        }
        m_servers.push_back(std::move(server));
    }

    Server* ProcessEngine::FindServer(const std::string& hostname) const {
        for (const auto& s : m_servers) {
            if (s->Hostname() == hostname) return s.get();
        }
        return nullptr;
    }

    void ProcessEngine::SetNotifier(std::shared_ptr<IUserNotifier> notifier) {
        m_notifier = notifier ? std::move(notifier) : std::make_shared<DefaultNotifier>();
    }

    void ProcessEngine::AddProcessListListener(ProcessListListener listener) {
        if (listener) m_listeners.push_back(std::move(listener));
    }

    void ProcessEngine::EmitProcessListChanged() {
        for (const auto& listener : m_listeners) listener();
    }

    void ProcessEngine::NotifyUser(const std::string& message) {
        m_notifier->Notify(message);
    }

    // ---------------------------------------------------------------- start surface

    ProcessId ProcessEngine::StartProcess(std::shared_ptr<RunningScript> script, Server& server,
                                          std::optional<ProcessId> parentPid) {
        if (!script) return InvalidProcessId;
        if (!CreateAndAddWorkerScript(script, server, parentPid, true)) {
            return InvalidProcessId;
        }
        return script->GetPid();
    }

    bool ProcessEngine::CreateAndAddWorkerScript(const std::shared_ptr<RunningScript>& script, Server& server,
                                                 std::optional<ProcessId> parentPid, bool addToServer) {
        if (script->GetPid() != InvalidProcessId) {
            HOST_PRINT(HostLogging::LogLevel::Error, "[ProcessEngine] ", script->filename, " already ran as pid ",
                       script->GetPid(), "; a running-script record backs one process only");
            return false;
        }

        const Script* source = server.FindScript(script->filename);
        if (!source) {
            HOST_PRINT(HostLogging::LogLevel::Error, "[ProcessEngine] ", script->filename, " does not exist on ",
                       server.Hostname());
            return false;
        }

        // pid first: a failed allocation must not leave RAM reserved
        std::optional<ProcessId> pid = m_context.Registry().Allocate();
        if (!pid) {
            NotifyUser("Failed to start script because could not find available PID. This is most "
                       "likely because you have too many scripts running.");
            return false;
        }

        AdmissionResult admission = AdmissionController::Admit(*script, server.Ram());
        if (!admission) {
            NotifyUser("Not enough RAM to run script " + script->filename + " with args " +
                       ArrayToString(script->args) + ". This likely occurred because you re-loaded "
                       "the game and the script's RAM usage increased (either because of an update to the game or "
                       "your changes to the script.)");
            HOST_PRINT(HostLogging::LogLevel::Warn, "[ProcessEngine] admission rejected for ", script->filename, ": ",
                       admission.reason);
            return false;
        }

        script->hostname = server.Hostname();
        script->AssignPid(*pid);

        auto ws = std::make_shared<WorkerScript>(*pid, script, server, source->code, parentPid,
                                                 static_cast<size_t>(std::max(1, m_settings.maxLogCapacity)));
        ws->SetRamUsage(admission.cost);
        ws->SetRunning(true);
        if (parentPid) ws->SetParent(m_context.Registry().Lookup(*parentPid));

        m_context.Registry().Register(*pid, ws);
        if (addToServer) server.AddRunningScript(script);
        EmitProcessListChanged();

        HOST_PRINT(HostLogging::LogLevel::Debug, "[ProcessEngine] started ", script->filename, "@", server.Hostname(),
                   " pid ", *pid, " (", admission.cost, "GB, ", script->threads, " threads)");

        ProcessDriver::Create(*this, ws)->Start();
        return true;
    }

    ProcessId ProcessEngine::StartNestedProcess(WorkerScript& caller, Server& server, const Value& scriptName,
                                                const Value& args, double threads,
                                                const std::string& callingFunction) {
        if (!scriptName.IsString() || !args.IsArray()) {
            caller.Log(callingFunction, "Invalid arguments: scriptname='" + scriptName.ToDisplayString() +
                       "' args='" + args.ToDisplayString() + "'");
            HOST_LOG_ERROR("[ProcessEngine] nested start failed due to invalid arguments");
            return InvalidProcessId;
        }
        const std::string& name = scriptName.AsString();
        const ValueList& argList = args.Items();

        if (server.FindRunningScript(name, argList)) {
            caller.Log(callingFunction, "'" + name + "' is already running on '" + server.Hostname() + "'");
            return InvalidProcessId;
        }

        for (const auto& arg : argList) {
            if (arg.IsNil()) {
                caller.Log(callingFunction, "Cannot execute a script with null/undefined as an argument");
                return InvalidProcessId;
            }
        }

        const Script* script = server.FindScript(name);
        if (!script) {
            caller.Log(callingFunction, "Could not find script '" + name + "' on '" + server.Hostname() + "'");
            return InvalidProcessId;
        }

        const double rounded = std::isfinite(threads) ? std::round(threads) : 0.0;
        if (rounded <= 0.0 || rounded > 2147483647.0) {
            caller.Log(callingFunction, "Invalid thread count passed to " + callingFunction + ": " +
                       Value(threads).ToDisplayString() + ". Threads must be positive");
            return InvalidProcessId;
        }
        const int threadCount = static_cast<int>(rounded);

        if (!server.HasAdminRights()) {
            caller.Log(callingFunction, "You do not have root access on '" + server.Hostname() + "'");
            return InvalidProcessId;
        }

        const double ramUsage = RoundToTwo(script->ramUsage * threadCount);
        if (ramUsage > server.Ram().Available()) {
            caller.Log(callingFunction, "Cannot run script '" + name + "' (t=" + std::to_string(threadCount) +
                       ") on '" + server.Hostname() + "' because there is not enough available RAM!");
            return InvalidProcessId;
        }

        caller.Log(callingFunction, "'" + name + "' on '" + server.Hostname() + "' with " +
                   std::to_string(threadCount) + " threads and args: " + ArrayToString(argList) + ".");

        auto running = std::make_shared<RunningScript>(*script, argList);
        running->threads = threadCount;
        return StartProcess(running, server, caller.Pid());
    }

    // ---------------------------------------------------------------- kill / prestige / rehydrate

    bool ProcessEngine::KillProcess(ProcessId pid) {
        WorkerScriptPtr ws = m_context.Registry().Lookup(pid);
        if (!ws) return false;
        ws->Env().stopFlag = true;
        return Teardown(*ws);
    }

    void ProcessEngine::KillAll() {
        for (const auto& ws : m_context.Registry().AllLive()) {
            ws->Env().stopFlag = true;
            Teardown(*ws);
        }
        m_context.Registry().Clear();
    }

    void ProcessEngine::Prestige() {
        KillAll();
        m_context.Reset();
        HOST_LOG_INFO("[ProcessEngine] prestige: all processes stopped, ports cleared");
    }

    void ProcessEngine::RehydrateFromPersisted(const std::vector<ServerPtr>& servers, OfflineProductionFn offline) {
        if (m_settings.skipScriptLoad) {
            HOST_LOG_INFO("[ProcessEngine] Skipping the load of any scripts during startup");
        }

        for (const auto& server : servers) {
            if (!server) continue;
            if (!FindServer(server->Hostname())) AddServer(server);

            server->Ram().Reset();

            if (m_settings.skipScriptLoad) {
                server->ClearRunningScripts();
                continue;
            }

            // copy: failed starts are removed from the server while iterating
            std::vector<std::shared_ptr<RunningScript>> persisted = server->RunningScripts();
            for (const auto& script : persisted) {
                if (!CreateAndAddWorkerScript(script, *server, std::nullopt, false)) {
                    server->RemoveRunningScript(script.get());
                    continue;
                }
                if (offline) offline(*script, *server);
            }
        }
    }

    void ProcessEngine::UpdateOnlineScriptTimes(int numCycles) {
        const double seconds = (static_cast<double>(numCycles) * m_settings.idleSpeedMs) / 1000.0;
        for (const auto& ws : m_context.Registry().AllLive()) {
            ws->ScriptRef().onlineRunningTime += seconds;
        }
    }

    // ---------------------------------------------------------------- host functions

    namespace {
        double NumberArg(const ValueList& args, size_t index, double fallback) {
            if (index >= args.size() || !args[index].IsNumber()) return fallback;
            return args[index].AsNumber();
        }

        const Value& ArgOrNil(const ValueList& args, size_t index) {
            static const Value nil;
            return index < args.size() ? args[index] : nil;
        }
    }

    HostCallResult ProcessEngine::InvokeCapability(WorkerScript& ws, Capability capability, const ValueList& args) {
        const CapabilityDescriptor& descriptor = Describe(capability);

        if (descriptor.provider == CapabilityProvider::Game) {
            if (!m_game) {
                throw ScriptRuntimeError(Error::MakeRuntimeErrorMessage(ws.GetServer().Hostname(), ws.Name(),
                    std::string(descriptor.name) + "() is not available on this host"));
            }
            if (descriptor.kind == CallKind::Action) {
                PromisePtr promise = m_game->BeginAction(capability, ws, args, m_loop);
                if (!promise) {
                    throw ScriptRuntimeError(Error::MakeRuntimeErrorMessage(ws.GetServer().Hostname(), ws.Name(),
                        std::string(descriptor.name) + "() could not be started"));
                }
                return HostCallResult::Deferred(std::move(promise));
            }
            return HostCallResult::Immediate(m_game->Query(capability, ws, args));
        }

        switch (capability) {
        case Capability::Sleep:
            return Sleep(ws, args);
        case Capability::Print:
            ws.Log("", JoinDisplay(args));
            return HostCallResult::Immediate(Value());
        case Capability::Tprint:
            m_notifier->Terminal(ws.Name() + ": " + JoinDisplay(args));
            return HostCallResult::Immediate(Value());
        case Capability::Run:
            return Run(ws, args);
        case Capability::Exec:
            return Exec(ws, args);
        case Capability::Exit:
            return Exit(ws);
        case Capability::GetHostname:
            return HostCallResult::Immediate(Value(ws.GetServer().Hostname()));
        case Capability::GetScriptName:
            return HostCallResult::Immediate(Value(ws.Name()));
        case Capability::WritePort: {
            MessagePort& port = RequirePort(args, descriptor.name);
            std::optional<Value> dropped = port.Write(ArgOrNil(args, 1));
            return HostCallResult::Immediate(dropped ? *dropped : Value());
        }
        case Capability::ReadPort:
            return HostCallResult::Immediate(RequirePort(args, descriptor.name).Read());
        case Capability::PeekPort:
            return HostCallResult::Immediate(RequirePort(args, descriptor.name).Peek());
        case Capability::ClearPort:
            RequirePort(args, descriptor.name).Clear();
            return HostCallResult::Immediate(Value());
        default:
            break;
        }
        throw ScriptRuntimeError(std::string("unhandled host function ") + descriptor.name);
    }

    HostCallResult ProcessEngine::Sleep(WorkerScript& ws, const ValueList& args) {
        double ms = NumberArg(args, 0, 0.0);
        if (std::isnan(ms) || ms < 0.0) ms = 0.0;
        // Anything past the loop's horizon sleeps forever.
        const double horizon = static_cast<double>(EventLoop::MaxTime / 2);
        const int64_t delay = ms >= horizon ? EventLoop::MaxTime : static_cast<int64_t>(std::round(ms));

        ws.Log("sleep", "Sleeping for " + std::to_string(delay) + " milliseconds");
        PromisePtr promise = ScriptPromise::Create(m_loop);
        m_loop.Schedule(delay, [promise]() { promise->Resolve(Value(true)); });
        return HostCallResult::Deferred(std::move(promise));
    }

    HostCallResult ProcessEngine::Run(WorkerScript& ws, const ValueList& args) {
        if (args.empty()) {
            throw ScriptRuntimeError(Error::MakeRuntimeErrorMessage(ws.GetServer().Hostname(), ws.Name(),
                "run() call has incorrect number of arguments. Usage: run(scriptname, [numThreads], [arg1], [arg2]...)"));
        }
        const double threads = args.size() > 1 ? (args[1].IsNumber() ? args[1].AsNumber() : NAN) : 1.0;
        ValueList rest;
        for (size_t i = 2; i < args.size(); ++i) rest.push_back(args[i]);

        ProcessId pid = StartNestedProcess(ws, ws.GetServer(), args[0], Value::MakeArray(std::move(rest)), threads, "run");
        return HostCallResult::Immediate(Value(static_cast<int>(pid)));
    }

    HostCallResult ProcessEngine::Exec(WorkerScript& ws, const ValueList& args) {
        if (args.size() < 2) {
            throw ScriptRuntimeError(Error::MakeRuntimeErrorMessage(ws.GetServer().Hostname(), ws.Name(),
                "exec() call has incorrect number of arguments. Usage: exec(scriptname, server, [numThreads], [arg1], [arg2]...)"));
        }
        const std::string hostname = args[1].ToDisplayString();
        Server* target = FindServer(hostname);
        if (!target) {
            throw ScriptRuntimeError(Error::MakeRuntimeErrorMessage(ws.GetServer().Hostname(), ws.Name(),
                "Invalid hostname/ip passed into exec() command: " + hostname));
        }
        const double threads = args.size() > 2 ? (args[2].IsNumber() ? args[2].AsNumber() : NAN) : 1.0;
        ValueList rest;
        for (size_t i = 3; i < args.size(); ++i) rest.push_back(args[i]);

        ProcessId pid = StartNestedProcess(ws, *target, args[0], Value::MakeArray(std::move(rest)), threads, "exec");
        return HostCallResult::Immediate(Value(static_cast<int>(pid)));
    }

    HostCallResult ProcessEngine::Exit(WorkerScript& ws) {
        ws.Log("exit", "Exiting...");
        ws.Env().stopFlag = true;
        Teardown(ws);
        throw StopSignal();
    }

    MessagePort& ProcessEngine::RequirePort(const ValueList& args, const char* function) {
        const double n = NumberArg(args, 0, NAN);
        const bool inRange = n >= 1.0 && n <= static_cast<double>(m_context.PortCount());
        MessagePort* port = inRange ? m_context.Port(static_cast<int>(n)) : nullptr;
        if (!port || std::floor(n) != n) {
            throw ScriptRuntimeError(std::string(function) + ": Trying to use an invalid port: " +
                Value(n).ToDisplayString() + ". Only ports 1-" + std::to_string(m_context.PortCount()) + " are valid.");
        }
        return *port;
    }

} // namespace WorkerHost
