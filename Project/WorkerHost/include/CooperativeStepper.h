#pragma once
// CooperativeStepper.h
//
// Legacy execution mode. Imports are inlined before compiling, then the script runs in steps of
// at most instructionsPerStep VM instructions with instructionTimeSliceMs between steps.
// Blocking host functions suspend the thread until their promise settles.

#include "ProcessDriver.h"

namespace WorkerHost {

    class CooperativeStepper : public ProcessDriver {
    public:
        CooperativeStepper(ProcessEngine& engine, std::shared_ptr<WorkerScript> ws)
            : ProcessDriver(engine, std::move(ws)) {}

    protected:
        std::string PrepareSource(int& lineOffset) override;
        void ConfigureThread(ScriptThread& thread) override;
        int64_t NextStepDelay() const override;
        std::string PreparationFailureNotice() const override { return "Error processing Imports in "; }
    };

} // namespace WorkerHost
