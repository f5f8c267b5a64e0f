#pragma once
// CallSerializer.h
//
// Guards native-mode host calls: at most one non-exempt call may be in flight per process.
//
//   stop flag set             -> StopSignal
//   sleep-exempt capability   -> invoked directly, never marks or checks the in-flight slot
//   another call in flight    -> process error set + ConcurrentCallViolation
//   otherwise                 -> slot marked, call invoked; the slot clears when the call throws,
//                                returns a value, or (for a promise) once the promise settles.

#include <functional>
#include <string>

#include "Capability.h"

namespace WorkerHost {

    class WorkerScript;

    class CallSerializer {
    public:
        using Invocation = std::function<HostCallResult()>;

        explicit CallSerializer(WorkerScript& ws) : m_ws(ws) {}

        HostCallResult Invoke(const CapabilityDescriptor& capability, const Invocation& call);

        static std::string ConcurrentCallMessage(const std::string& running, const std::string& attempted);

    private:
        WorkerScript& m_ws;
    };

} // namespace WorkerHost
