#include "CallSerializer.h"
#include "WorkerScript.h"
#include "Server.h"
#include "ScriptError.h"
#include "Logging.hpp"

namespace WorkerHost {

    std::string CallSerializer::ConcurrentCallMessage(const std::string& running, const std::string& attempted) {
        return "Concurrent calls to Netscript functions not allowed! "
               "Did you forget to await hack(), grow(), or some other "
               "promise-returning function? (Currently running: " +
               running + " tried to run: " + attempted + ")";
    }

    HostCallResult CallSerializer::Invoke(const CapabilityDescriptor& capability, const Invocation& call) {
        if (m_ws.Env().stopFlag) {
            throw StopSignal();
        }

        if (capability.sleepExempt) {
            return call();
        }

        if (!m_ws.InFlightCall().empty()) {
            std::string message = Error::MakeRuntimeErrorMessage(
                m_ws.GetServer().Hostname(), m_ws.Name(),
                ConcurrentCallMessage(m_ws.InFlightCall(), capability.name));
            HOST_PRINT(HostLogging::LogLevel::Warn, "[CallSerializer] pid ", m_ws.Pid(), ": ", capability.name,
                       " while ", m_ws.InFlightCall(), " is in flight");
            m_ws.SetError(RuntimeErrorMessage{ message });
            throw ConcurrentCallViolation(message);
        }

        m_ws.SetInFlightCall(capability.name);
        HostCallResult result;
        try {
            result = call();
        }
        catch (...) {
            m_ws.ClearInFlightCall();
            throw;
        }

        if (!result.promise) {
            m_ws.ClearInFlightCall();
            return result;
        }

        // Clears on settlement, never inline: an un-awaited call still blocks the next one.
        std::weak_ptr<WorkerScript> weak = m_ws.weak_from_this();
        std::string name = capability.name;
        result.promise->OnSettled([weak, name](const ScriptPromise&) {
            auto ws = weak.lock();
            if (ws && ws->InFlightCall() == name) ws->ClearInFlightCall();
        });
        return result;
    }

} // namespace WorkerHost
