#pragma once
// ProcessRegistry.h
//
// pid -> live WorkerScript table plus the pid allocator.
//
// Allocation searches upward from the last handed-out pid, wraps back to 1 after maxPid and
// gives up (std::nullopt) after maxConcurrentProcesses candidates or when the table is full.
// A pid is never handed out while a process holding it is registered.

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "WorkerHostTypes.h"

namespace WorkerHost {

    class WorkerScript;

    class ProcessRegistry {
    public:
        explicit ProcessRegistry(int maxConcurrentProcesses = 1000, ProcessId maxPid = 2147483647);

        void Configure(int maxConcurrentProcesses, ProcessId maxPid);

        std::optional<ProcessId> Allocate();

        // Returns false if the pid is invalid or already registered.
        bool Register(ProcessId pid, std::shared_ptr<WorkerScript> process);
        // Returns false if nothing was registered under pid.
        bool Unregister(ProcessId pid);

        std::shared_ptr<WorkerScript> Lookup(ProcessId pid) const;
        bool Contains(ProcessId pid) const { return m_processes.count(pid) != 0; }

        // Ordered by pid.
        std::vector<std::shared_ptr<WorkerScript>> AllLive() const;
        size_t Size() const { return m_processes.size(); }

        void Clear();
        void ResetPidCounter() { m_nextPid = 1; }

    private:
        std::unordered_map<ProcessId, std::shared_ptr<WorkerScript>> m_processes;
        ProcessId m_nextPid = 1;
        int m_maxConcurrent;
        ProcessId m_maxPid;
    };

} // namespace WorkerHost
