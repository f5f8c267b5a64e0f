#include "AdmissionController.h"
#include "RunningScript.h"
#include "Server.h"

#include <sstream>

namespace WorkerHost {

    double AdmissionController::ComputeCost(const RunningScript& script) {
        int threads = script.threads < 1 ? 1 : script.threads;
        return RoundToTwo(script.ramUsage * threads);
    }

    AdmissionResult AdmissionController::Admit(RunningScript& script, CapacityPool& pool) {
        if (script.threads < 1) script.threads = 1;

        AdmissionResult result;
        result.cost = ComputeCost(script);

        if (!pool.TryReserve(result.cost)) {
            std::ostringstream oss;
            oss << "needs " << result.cost << "GB but only " << pool.Available()
                << "GB of " << pool.Total() << "GB is available";
            result.reason = oss.str();
            return result;
        }
        result.admitted = true;
        return result;
    }

    void AdmissionController::Release(CapacityPool& pool, double cost) {
        pool.Release(cost);
    }

} // namespace WorkerHost
