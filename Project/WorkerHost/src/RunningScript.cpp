#include "RunningScript.h"
#include "Server.h"

namespace WorkerHost {

    RunningScript::RunningScript(const Script& script, ValueList scriptArgs)
        : filename(script.filename), args(std::move(scriptArgs)), ramUsage(script.ramUsage) {}

    bool RunningScript::AssignPid(ProcessId newPid) {
        if (pid != InvalidProcessId || newPid == InvalidProcessId) return false;
        pid = newPid;
        return true;
    }

    void RunningScript::AddLog(const std::string& line, size_t maxCapacity) {
        logs.push_back(line);
        while (logs.size() > maxCapacity) {
            logs.pop_front();
        }
    }

    bool RunningScript::Matches(const std::string& otherFilename, const ValueList& otherArgs) const {
        return filename == otherFilename && args == otherArgs;
    }

} // namespace WorkerHost
