#pragma once
// ProcessDriver.h
//
// Drives one process's Lua thread on the event loop and turns however it ends into exactly one
// ProcessCompletion for the engine.
//
// Start():   prepare source (subclass), compile, bind host functions, schedule the first step.
//            Preparation/compile failures notify the user, tear the process down and settle it
//            as Stopped/AlreadyTerminated without ever stepping.
// Resume:    yielded on a promise -> resume when it settles with (ok, value|reason)
//            plain yield          -> resume after NextStepDelay()
//            returned             -> Finished
//            raised               -> Stopped (stop signal) or Crashed (classified reason)
//            error slot set       -> Crashed with that reason, whatever the thread did
//
// Subclasses: CooperativeStepper (legacy), NativeRunner (native).

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "ScriptError.h"
#include "WorkerHostTypes.h"

namespace WorkerHost {

    class ProcessEngine;
    class ScriptPromise;
    class ScriptThread;
    class WorkerScript;
    struct ResumeResult;

    struct ProcessCompletion {
        ProcessOutcome outcome = ProcessOutcome::Finished;
        std::optional<TerminationReason> reason;

        bool IsSuccess() const { return outcome == ProcessOutcome::Finished; }
    };

    class ProcessDriver : public std::enable_shared_from_this<ProcessDriver> {
    public:
        ProcessDriver(ProcessEngine& engine, std::shared_ptr<WorkerScript> ws);
        virtual ~ProcessDriver() = default;

        void Start();

        bool IsCompleted() const { return m_completed; }
        const std::shared_ptr<WorkerScript>& Process() const { return m_ws; }

        // Dispatch on the script's format.
        static std::shared_ptr<ProcessDriver> Create(ProcessEngine& engine, std::shared_ptr<WorkerScript> ws);

    protected:
        // Source to compile. May throw to report a preprocessing failure.
        virtual std::string PrepareSource(int& lineOffset) = 0;
        virtual void ConfigureThread(ScriptThread& thread) { (void)thread; }
        // Delay before resuming a thread that yielded without a promise.
        virtual int64_t NextStepDelay() const = 0;
        // Prefix of the user notice when PrepareSource throws.
        virtual std::string PreparationFailureNotice() const = 0;

        ProcessEngine& m_engine;
        std::shared_ptr<WorkerScript> m_ws;

    private:
        void Step();
        void ResumeWith(const ScriptPromise& settled);
        void HandleResume(const ResumeResult& result);
        void FailBeforeStart(const std::string& notice);
        void OnStopped();
        TerminationReason ClassifyError(int errorCode);
        void Complete(ProcessOutcome outcome, std::optional<TerminationReason> reason);

        bool m_completed = false;
    };

} // namespace WorkerHost
