#pragma once
// HostContext.h
//
// Process-wide shared state of one engine instance: the process registry and the message ports.
// Reset() returns both to their initial state (prestige).

#include <vector>

#include "MessagePort.h"
#include "ProcessRegistry.h"

struct HostSettingsData;

namespace WorkerHost {

    class HostContext {
    public:
        explicit HostContext(const HostSettingsData& settings);

        ProcessRegistry& Registry() { return m_registry; }
        const ProcessRegistry& Registry() const { return m_registry; }

        // Ports are numbered from 1. nullptr when out of range.
        MessagePort* Port(int portNumber);
        size_t PortCount() const { return m_ports.size(); }

        void Reset();

    private:
        ProcessRegistry m_registry;
        std::vector<MessagePort> m_ports;
    };

} // namespace WorkerHost
