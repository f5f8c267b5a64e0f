// ProcessDriver.cpp
#include "ProcessDriver.h"
#include "CooperativeStepper.h"
#include "NativeRunner.h"
#include "HostBindings.h"
#include "ProcessEngine.h"
#include "ScriptThread.h"
#include "ScriptUtils.h"
#include "Server.h"
#include "WorkerScript.h"
#include "Logging.hpp"

extern "C" {
#include "lua.h"
#include "lauxlib.h"
}

namespace WorkerHost {

    ProcessDriver::ProcessDriver(ProcessEngine& engine, std::shared_ptr<WorkerScript> ws)
        : m_engine(engine), m_ws(std::move(ws)) {}

    std::shared_ptr<ProcessDriver> ProcessDriver::Create(ProcessEngine& engine, std::shared_ptr<WorkerScript> ws) {
        if (ws->Format() == ScriptFormat::Native) {
            return std::make_shared<NativeRunner>(engine, std::move(ws));
        }
        return std::make_shared<CooperativeStepper>(engine, std::move(ws));
    }

    void ProcessDriver::Start() {
        int lineOffset = 0;
        std::string code;
        try {
            code = PrepareSource(lineOffset);
        }
        catch (const std::exception& e) {
            FailBeforeStart(PreparationFailureNotice() + m_ws->Name() + ":\n" + e.what());
            return;
        }
        m_ws->SetLineOffset(lineOffset);

        auto thread = std::make_unique<ScriptThread>(m_engine.VM());
        std::string compileError;
        if (!thread->Load(code, m_ws->Name(), m_ws.get(), compileError)) {
            m_ws->AttachThread(std::move(thread));
            FailBeforeStart("Syntax ERROR in " + m_ws->Name() + ":\n" +
                            Error::MapErrorPosition(compileError, m_ws->Name(), lineOffset));
            return;
        }

        lua_State* L = thread->MainState();
        {
            LuaStackGuard guard(L);
            thread->PushEnvironment(L);
            HostBindings::Install(L, -1, m_engine, *m_ws, m_engine.HasGameFunctions());
        }
        ConfigureThread(*thread);
        m_ws->AttachThread(std::move(thread));

        std::weak_ptr<ProcessDriver> weak = weak_from_this();
        m_ws->SetStopHandler([weak]() {
            if (auto self = weak.lock()) {
                self->m_engine.Loop().Post([self]() { self->OnStopped(); });
            }
        });

        auto self = shared_from_this();
        m_engine.Loop().Post([self]() { self->Step(); });
    }

    void ProcessDriver::FailBeforeStart(const std::string& notice) {
        HOST_PRINT(HostLogging::LogLevel::Error, "[ProcessDriver] pid ", m_ws->Pid(), ": ", notice);
        m_engine.NotifyUser(notice);
        m_ws->Env().stopFlag = true;
        m_ws->SetRunning(false);
        m_engine.Teardown(*m_ws);

        auto self = shared_from_this();
        m_engine.Loop().Post([self]() { self->Complete(ProcessOutcome::Stopped, TerminationReason{ AlreadyTerminated{} }); });
    }

    void ProcessDriver::OnStopped() {
        if (m_completed) return;
        ScriptThread* thread = m_ws->Thread();
        if (thread && thread->IsExecuting()) return;
        Complete(ProcessOutcome::Stopped, TerminationReason{ AlreadyTerminated{} });
    }

    void ProcessDriver::Step() {
        if (m_completed) return;
        if (m_ws->Env().stopFlag) {
            Complete(ProcessOutcome::Stopped, TerminationReason{ AlreadyTerminated{} });
            return;
        }
        ScriptThread* thread = m_ws->Thread();
        if (!thread || !thread->IsLoaded()) {
            Complete(ProcessOutcome::Stopped, TerminationReason{ AlreadyTerminated{} });
            return;
        }
        HandleResume(thread->Resume(0));
    }

    void ProcessDriver::ResumeWith(const ScriptPromise& settled) {
        if (m_completed) return;
        if (m_ws->Env().stopFlag) {
            Complete(ProcessOutcome::Stopped, TerminationReason{ AlreadyTerminated{} });
            return;
        }
        ScriptThread* thread = m_ws->Thread();
        if (!thread || !thread->IsLoaded()) {
            Complete(ProcessOutcome::Stopped, TerminationReason{ AlreadyTerminated{} });
            return;
        }

        lua_State* co = thread->Coroutine();
        lua_pushboolean(co, settled.IsResolved() ? 1 : 0);
        if (settled.IsResolved()) {
            PushValue(co, settled.GetValue());
        }
        else {
            lua_pushlstring(co, settled.GetReason().c_str(), settled.GetReason().size());
        }
        HandleResume(thread->Resume(2));
    }

    void ProcessDriver::HandleResume(const ResumeResult& result) {
        try {
            if (m_ws->HasError()) {
                TerminationReason reason = *m_ws->Error();
                Complete(ProcessOutcome::Crashed, reason);
                return;
            }

            switch (result.status) {
            case ResumeStatus::Finished:
                Complete(ProcessOutcome::Finished, std::nullopt);
                return;

            case ResumeStatus::Errored: {
                TerminationReason reason = ClassifyError(result.errorCode);
                const bool stopped = std::holds_alternative<AlreadyTerminated>(reason);
                Complete(stopped ? ProcessOutcome::Stopped : ProcessOutcome::Crashed, reason);
                return;
            }

            case ResumeStatus::Yielded: {
                if (m_ws->Env().stopFlag) {
                    Complete(ProcessOutcome::Stopped, TerminationReason{ AlreadyTerminated{} });
                    return;
                }
                auto self = shared_from_this();
                PromisePtr pending = m_ws->TakePendingPromise();
                if (pending) {
                    pending->OnSettled([self](const ScriptPromise& settled) { self->ResumeWith(settled); });
                }
                else {
                    m_engine.Loop().Schedule(NextStepDelay(), [self]() { self->Step(); });
                }
                return;
            }
            }
        }
        catch (const std::exception& e) {
            HOST_PRINT(HostLogging::LogLevel::Error, "[ProcessDriver] pid ", m_ws->Pid(), " host fault: ", e.what());
            Complete(ProcessOutcome::Crashed, TerminationReason{ NativeFault{ e.what() } });
        }
    }

    TerminationReason ProcessDriver::ClassifyError(int errorCode) {
        ScriptThread* thread = m_ws->Thread();
        lua_State* co = thread ? thread->Coroutine() : nullptr;
        lua_State* L = thread ? thread->MainState() : nullptr;
        if (!co || !L) {
            return NativeFault{ "script thread vanished while raising an error" };
        }

        if (HostBindings::IsStopSignal(co, -1)) {
            return AlreadyTerminated{};
        }

        if (lua_type(co, -1) == LUA_TSTRING) {
            HOST_PRINT(HostLogging::LogLevel::Debug, "[ProcessDriver] ", m_ws->Name(), "@",
                       m_ws->GetServer().Hostname(), "\n", Error::FormatLuaError(co, errorCode));
        }
        if (errorCode == LUA_ERRMEM || errorCode == LUA_ERRERR) {
            std::string what;
            GetStringSafe(co, -1, what);
            return NativeFault{ what.empty() ? std::string("Lua VM failure") : what };
        }

        // Work on the main state: metamethods must not run on the dead coroutine.
        LuaStackGuard guard(L);
        lua_xmove(co, L, 1);

        std::string message;
        const int type = lua_type(L, -1);
        if (type == LUA_TSTRING || type == LUA_TNUMBER) {
            GetStringSafe(L, -1, message);
        }
        else if (luaL_getmetafield(L, -1, "__tostring") != LUA_TNIL) {
            lua_pop(L, 1);
            if (!Error::ProtectedToString(L, -1, message)) {
                return Unrecognized{ std::string("error object is a ") + luaL_typename(L, -1) +
                                     " value whose __tostring failed" };
            }
        }
        else {
            return Unrecognized{ std::string("error object is a ") + luaL_typename(L, -1) + " value" };
        }

        if (Error::IsRuntimeErrorMessage(message)) {
            return RuntimeErrorMessage{ message };
        }
        return RuntimeErrorMessage{ Error::MakeRuntimeErrorMessage(
            m_ws->GetServer().Hostname(), m_ws->Name(),
            Error::MapErrorPosition(message, m_ws->Name(), m_ws->LineOffset())) };
    }

    void ProcessDriver::Complete(ProcessOutcome outcome, std::optional<TerminationReason> reason) {
        if (m_completed) return;
        m_completed = true;

        m_ws->SetStopHandler(nullptr);
        if (ScriptThread* thread = m_ws->Thread()) {
            if (!thread->IsExecuting()) thread->Release();
        }

        ProcessCompletion completion;
        completion.outcome = outcome;
        completion.reason = std::move(reason);
        m_engine.OnProcessSettled(m_ws, completion);
    }

} // namespace WorkerHost
