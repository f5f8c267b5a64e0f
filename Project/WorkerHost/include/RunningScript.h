#pragma once
// RunningScript.h
//
// Persistent record of one script invocation on a server: what runs (filename, args, threads),
// what it costs, what it has earned and its log. Survives save/load; the live process backing it
// is a WorkerScript.

#include <deque>
#include <string>

#include "Value.h"
#include "WorkerHostTypes.h"

namespace WorkerHost {

    struct Script;

    struct RunningScript {
        RunningScript() = default;
        RunningScript(const Script& script, ValueList scriptArgs);

        std::string filename;
        std::string hostname;
        ValueList args;
        int threads = 1;
        double ramUsage = 0.0; // per thread

        double onlineRunningTime = 0.0;
        double onlineMoneyMade = 0.0;
        double onlineExpGained = 0.0;
        double offlineRunningTime = 0.0;
        double offlineMoneyMade = 0.0;
        double offlineExpGained = 0.0;

        std::deque<std::string> logs;

        ProcessId GetPid() const { return pid; }
        // The pid is assigned once. Returns false if this record already has one.
        bool AssignPid(ProcessId newPid);

        // Oldest lines are dropped beyond maxCapacity.
        void AddLog(const std::string& line, size_t maxCapacity);

        bool Matches(const std::string& otherFilename, const ValueList& otherArgs) const;

    private:
        ProcessId pid = InvalidProcessId;
    };

} // namespace WorkerHost
