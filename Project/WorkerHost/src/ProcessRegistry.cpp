#include "ProcessRegistry.h"
#include "WorkerScript.h"
#include "Logging.hpp"

#include <algorithm>

namespace WorkerHost {

    ProcessRegistry::ProcessRegistry(int maxConcurrentProcesses, ProcessId maxPid)
        : m_maxConcurrent(std::max(1, maxConcurrentProcesses)), m_maxPid(std::max<ProcessId>(1, maxPid)) {}

    void ProcessRegistry::Configure(int maxConcurrentProcesses, ProcessId maxPid) {
        m_maxConcurrent = std::max(1, maxConcurrentProcesses);
        m_maxPid = std::max<ProcessId>(1, maxPid);
        if (m_nextPid > m_maxPid) m_nextPid = 1;
    }

    std::optional<ProcessId> ProcessRegistry::Allocate() {
        if (m_processes.size() >= static_cast<size_t>(m_maxConcurrent)) {
            return std::nullopt;
        }

        // 64-bit so stepping past INT32_MAX cannot overflow
        int64_t candidate = m_nextPid;
        for (int i = 0; i < m_maxConcurrent; ++i) {
            if (candidate < 1 || candidate > m_maxPid) candidate = 1;
            if (!Contains(static_cast<ProcessId>(candidate))) {
                m_nextPid = candidate >= m_maxPid ? 1 : static_cast<ProcessId>(candidate + 1);
                return static_cast<ProcessId>(candidate);
            }
            ++candidate;
        }
        return std::nullopt;
    }

    bool ProcessRegistry::Register(ProcessId pid, std::shared_ptr<WorkerScript> process) {
        if (pid == InvalidProcessId || !process) return false;
        auto inserted = m_processes.emplace(pid, std::move(process));
        if (!inserted.second) {
            HOST_PRINT(HostLogging::LogLevel::Error, "[ProcessRegistry] pid ", pid, " is already registered");
            return false;
        }
        return true;
    }

    bool ProcessRegistry::Unregister(ProcessId pid) {
        return m_processes.erase(pid) != 0;
    }

    std::shared_ptr<WorkerScript> ProcessRegistry::Lookup(ProcessId pid) const {
        auto it = m_processes.find(pid);
        if (it == m_processes.end()) return nullptr;
        return it->second;
    }

    std::vector<std::shared_ptr<WorkerScript>> ProcessRegistry::AllLive() const {
        std::vector<std::shared_ptr<WorkerScript>> out;
        out.reserve(m_processes.size());
        for (const auto& kv : m_processes) out.push_back(kv.second);
        std::sort(out.begin(), out.end(),
            [](const std::shared_ptr<WorkerScript>& a, const std::shared_ptr<WorkerScript>& b) { return a->Pid() < b->Pid(); });
        return out;
    }

    void ProcessRegistry::Clear() {
        m_processes.clear();
    }

} // namespace WorkerHost
