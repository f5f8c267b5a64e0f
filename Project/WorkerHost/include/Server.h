#pragma once
// Server.h
//
// A host machine: the scripts stored on it, its RAM pool and the running-script records
// currently attributed to it.

#include <memory>
#include <string>
#include <vector>

#include "RunningScript.h"

namespace WorkerHost {

    // Source stored on a server. ramUsage is the per-thread cost of running it.
    struct Script {
        std::string filename;
        std::string code;
        double ramUsage = 0.0;
    };

    double RoundToTwo(double value);

    // RAM capacity of a server. Reserved never exceeds Total and never drops below 0.
    class CapacityPool {
    public:
        explicit CapacityPool(double total = 0.0) : m_total(total) {}

        double Total() const { return m_total; }
        double Reserved() const { return m_reserved; }
        double Available() const { return RoundToTwo(m_total - m_reserved); }

        void SetTotal(double total) { m_total = total; }

        // All-or-nothing. Succeeds iff amount <= Available().
        bool TryReserve(double amount);
        // Clamped at zero.
        void Release(double amount);
        void Reset() { m_reserved = 0.0; }

    private:
        double m_total = 0.0;
        double m_reserved = 0.0;
    };

    class Server {
    public:
        explicit Server(std::string hostname, double maxRam = 0.0, bool hasAdminRights = true);

        const std::string& Hostname() const { return m_hostname; }

        CapacityPool& Ram() { return m_ram; }
        const CapacityPool& Ram() const { return m_ram; }

        bool HasAdminRights() const { return m_hasAdminRights; }
        void SetAdminRights(bool value) { m_hasAdminRights = value; }

        // Replaces a script with the same filename.
        void AddScript(Script script);
        const Script* FindScript(const std::string& filename) const;
        const std::vector<Script>& Scripts() const { return m_scripts; }

        const std::vector<std::shared_ptr<RunningScript>>& RunningScripts() const { return m_runningScripts; }
        std::shared_ptr<RunningScript> FindRunningScript(const std::string& filename, const ValueList& args) const;
        void AddRunningScript(std::shared_ptr<RunningScript> script);
        bool RemoveRunningScript(const RunningScript* script);
        void ClearRunningScripts() { m_runningScripts.clear(); }

    private:
        std::string m_hostname;
        CapacityPool m_ram;
        bool m_hasAdminRights = true;
        std::vector<Script> m_scripts;
        std::vector<std::shared_ptr<RunningScript>> m_runningScripts;
    };

    using ServerPtr = std::shared_ptr<Server>;

} // namespace WorkerHost
