// CompletionPipeline.cpp
//
// ProcessEngine members that settle a process: success/failure handling and the single
// teardown path shared by kill, exit, crash and natural completion.

#include "ProcessEngine.h"
#include "AdmissionController.h"
#include "ScriptThread.h"
#include "Logging.hpp"

namespace WorkerHost {

    void ProcessEngine::OnProcessSettled(const WorkerScriptPtr& ws, const ProcessCompletion& completion) {
        if (!ws) return;
        if (!ws->SetOutcome(completion.outcome)) {
            HOST_PRINT(HostLogging::LogLevel::Warn, "[CompletionPipeline] pid ", ws->Pid(), " settled twice, ignored");
            return;
        }

        if (completion.IsSuccess()) {
            HandleSuccess(*ws);
            return;
        }
        HandleFailure(*ws, completion.reason ? *completion.reason : TerminationReason{ AlreadyTerminated{} });
    }

    void ProcessEngine::HandleSuccess(WorkerScript& ws) {
        // Earnings go to the parent on natural completion only.
        if (WorkerScriptPtr parent = ws.Parent()) {
            if (parent->IsRunning() && m_context.Registry().Lookup(parent->Pid()) == parent) {
                parent->ScriptRef().onlineExpGained += ws.ScriptRef().onlineExpGained;
                parent->ScriptRef().onlineMoneyMade += ws.ScriptRef().onlineMoneyMade;
            }
        }

        // Already stopped elsewhere (exit(), kill during the last step).
        if (!ws.IsRunning()) return;

        Teardown(ws);
        ws.Log("", "Script finished running");
    }

    void ProcessEngine::HandleFailure(WorkerScript& ws, const TerminationReason& reason) {
        HOST_PRINT(HostLogging::LogLevel::Debug, "[CompletionPipeline] pid ", ws.Pid(), " ", ws.Name(), ": ",
                   DescribeReason(reason));

        if (std::holds_alternative<AlreadyTerminated>(reason)) {
            ws.Log("", "Script killed");
            Teardown(ws);
            return;
        }

        if (const auto* runtime = std::get_if<RuntimeErrorMessage>(&reason)) {
            std::optional<Error::RuntimeErrorFields> fields = Error::ParseRuntimeErrorMessage(runtime->text);
            if (!fields) {
                HOST_PRINT(HostLogging::LogLevel::Error, "[CompletionPipeline] malformed runtime error text: ",
                           runtime->text);
            }
            else {
                std::string msg = "RUNTIME ERROR\n" + fields->scriptName + "@" + fields->hostname + "\n";
                if (!ws.Args().empty()) {
                    msg += "Args: " + ArrayToString(ws.Args()) + "\n";
                }
                msg += "\n";
                msg += fields->message;

                NotifyUser(msg);
                ws.Log("", "Script crashed with runtime error");
            }
        }
        else if (const auto* fault = std::get_if<NativeFault>(&reason)) {
            NotifyUser("Script runtime unknown error. This is a bug please contact game developer");
            HOST_PRINT(HostLogging::LogLevel::Error, "[CompletionPipeline] host fault in ", ws.Name(), ": ", fault->what);
        }
        else if (const auto* unknown = std::get_if<Unrecognized>(&reason)) {
            NotifyUser("An unknown script died for an unknown reason. This is a bug please contact game dev");
            HOST_PRINT(HostLogging::LogLevel::Error, "[CompletionPipeline] ", ws.Name(), ": ", unknown->description);
        }

        ws.SetRunning(false);
        ws.Env().stopFlag = true;
        Teardown(ws);
    }

    bool ProcessEngine::Teardown(WorkerScript& ws) {
        if (!ws.MarkTornDown()) return false;

        ws.Env().stopFlag = true;
        ws.SetRunning(false);

        // Keep the process alive until the end of teardown; the registry may hold the last reference.
        WorkerScriptPtr keepAlive = ws.shared_from_this();
        m_context.Registry().Unregister(ws.Pid());

        AdmissionController::Release(ws.GetServer().Ram(), ws.RamUsage());
        ws.GetServer().RemoveRunningScript(&ws.ScriptRef());

        ws.NotifyStopped();
        if (ScriptThread* thread = ws.Thread()) {
            if (!thread->IsExecuting()) thread->Release();
        }

        HOST_PRINT(HostLogging::LogLevel::Debug, "[CompletionPipeline] pid ", ws.Pid(), " torn down, released ",
                   ws.RamUsage(), "GB on ", ws.GetServer().Hostname());
        EmitProcessListChanged();
        return true;
    }

} // namespace WorkerHost
