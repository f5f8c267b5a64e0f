#pragma once
// AdmissionController.h
//
// RAM admission for new processes. Cost = RoundToTwo(ramUsage * threads).
// A request is rejected iff cost > total - reserved; a request that exactly fills the
// remaining capacity is admitted.

#include <string>

namespace WorkerHost {

    struct RunningScript;
    class CapacityPool;

    struct AdmissionResult {
        bool admitted = false;
        double cost = 0.0;
        std::string reason;

        explicit operator bool() const { return admitted; }
    };

    class AdmissionController {
    public:
        static double ComputeCost(const RunningScript& script);

        // Normalizes script.threads (< 1 becomes 1) and reserves on success.
        static AdmissionResult Admit(RunningScript& script, CapacityPool& pool);

        static void Release(CapacityPool& pool, double cost);
    };

} // namespace WorkerHost
