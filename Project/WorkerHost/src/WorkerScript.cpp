#include "WorkerScript.h"
#include "ScriptThread.h"
#include "Server.h"
#include "Logging.hpp"

namespace WorkerHost {

    WorkerScript::WorkerScript(ProcessId pid, std::shared_ptr<RunningScript> script, Server& server, std::string code,
                               std::optional<ProcessId> parentPid, size_t maxLogCapacity)
        : m_pid(pid),
          m_script(std::move(script)),
          m_server(server),
          m_code(std::move(code)),
          m_format(FormatFromFilename(m_script->filename)),
          m_parentPid(parentPid),
          m_maxLogCapacity(maxLogCapacity) {}

    WorkerScript::~WorkerScript() = default;

    void WorkerScript::Log(const std::string& caller, const std::string& message) {
        std::string line = caller.empty() ? message : caller + ": " + message;
        m_script->AddLog(line, m_maxLogCapacity);
        HOST_PRINT(HostLogging::LogLevel::Debug, "[", m_script->filename, "@", m_server.Hostname(), " pid ", m_pid, "] ", line);
    }

    PromisePtr WorkerScript::TakePendingPromise() {
        PromisePtr p = std::move(m_pendingPromise);
        m_pendingPromise.reset();
        return p;
    }

    bool WorkerScript::SetOutcome(ProcessOutcome outcome) {
        if (m_outcome != ProcessOutcome::Running) return false;
        m_outcome = outcome;
        return true;
    }

    bool WorkerScript::MarkTornDown() {
        if (m_tornDown) return false;
        m_tornDown = true;
        return true;
    }

    void WorkerScript::AttachThread(std::unique_ptr<ScriptThread> thread) {
        m_thread = std::move(thread);
    }

    void WorkerScript::NotifyStopped() {
        std::function<void()> handler = std::move(m_stopHandler);
        m_stopHandler = nullptr;
        if (handler) handler();
    }

} // namespace WorkerHost
