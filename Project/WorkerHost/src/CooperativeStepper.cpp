#include "CooperativeStepper.h"
#include "ImportResolver.h"
#include "ProcessEngine.h"
#include "ScriptThread.h"
#include "Server.h"
#include "WorkerScript.h"

#include <algorithm>

namespace WorkerHost {

    std::string CooperativeStepper::PrepareSource(int& lineOffset) {
        Server& server = m_ws->GetServer();
        ImportResolver resolver([&server](const std::string& filename) { return server.FindScript(filename); });
        ImportResolution resolved = resolver.Resolve(m_ws->Code());
        lineOffset = resolved.lineOffset;
        return resolved.code;
    }

    void CooperativeStepper::ConfigureThread(ScriptThread& thread) {
        thread.SetInstructionBudget(std::max(1, m_engine.Settings().instructionsPerStep));
    }

    int64_t CooperativeStepper::NextStepDelay() const {
        return std::max(1, m_engine.Settings().instructionTimeSliceMs);
    }

} // namespace WorkerHost
