#pragma once
// NativeRunner.h
//
// Native execution mode. The script runs until it awaits a host promise, yields or returns; host
// calls are serialized per process. A bare coroutine.yield() resumes on the next tick.

#include "ProcessDriver.h"

namespace WorkerHost {

    class NativeRunner : public ProcessDriver {
    public:
        NativeRunner(ProcessEngine& engine, std::shared_ptr<WorkerScript> ws)
            : ProcessDriver(engine, std::move(ws)) {}

    protected:
        std::string PrepareSource(int& lineOffset) override;
        int64_t NextStepDelay() const override { return 1; }
        std::string PreparationFailureNotice() const override { return "Error loading "; }
    };

} // namespace WorkerHost
