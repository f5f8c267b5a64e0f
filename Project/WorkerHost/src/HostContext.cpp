#include "HostContext.h"
#include "Settings/HostSettings.hpp"

namespace WorkerHost {

    HostContext::HostContext(const HostSettingsData& settings)
        : m_registry(settings.maxConcurrentProcesses, settings.maxPid) {
        int count = settings.numPorts > 0 ? settings.numPorts : 1;
        size_t capacity = settings.maxPortCapacity > 0 ? static_cast<size_t>(settings.maxPortCapacity) : 1;
        m_ports.reserve(static_cast<size_t>(count));
        for (int i = 0; i < count; ++i) {
            m_ports.emplace_back(capacity);
        }
    }

    MessagePort* HostContext::Port(int portNumber) {
        if (portNumber < 1 || static_cast<size_t>(portNumber) > m_ports.size()) return nullptr;
        return &m_ports[static_cast<size_t>(portNumber - 1)];
    }

    void HostContext::Reset() {
        m_registry.Clear();
        m_registry.ResetPidCounter();
        for (auto& port : m_ports) port.Clear();
    }

} // namespace WorkerHost
