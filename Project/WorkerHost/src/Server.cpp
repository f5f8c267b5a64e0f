#include "Server.h"

#include <algorithm>
#include <cmath>

namespace WorkerHost {

    double RoundToTwo(double value) {
        return std::round(value * 100.0) / 100.0;
    }

    bool CapacityPool::TryReserve(double amount) {
        if (amount < 0.0 || amount > Available()) return false;
        m_reserved = RoundToTwo(m_reserved + amount);
        return true;
    }

    void CapacityPool::Release(double amount) {
        m_reserved = RoundToTwo(m_reserved - amount);
        if (m_reserved < 0.0) m_reserved = 0.0;
    }

    Server::Server(std::string hostname, double maxRam, bool hasAdminRights)
        : m_hostname(std::move(hostname)), m_ram(maxRam), m_hasAdminRights(hasAdminRights) {}

    void Server::AddScript(Script script) {
        for (auto& existing : m_scripts) {
            if (existing.filename == script.filename) {
                existing = std::move(script);
                return;
            }
        }
        m_scripts.push_back(std::move(script));
    }

    const Script* Server::FindScript(const std::string& filename) const {
        for (const auto& s : m_scripts) {
            if (s.filename == filename) return &s;
        }
        return nullptr;
    }

    std::shared_ptr<RunningScript> Server::FindRunningScript(const std::string& filename, const ValueList& args) const {
        for (const auto& rs : m_runningScripts) {
            if (rs && rs->Matches(filename, args)) return rs;
        }
        return nullptr;
    }

    void Server::AddRunningScript(std::shared_ptr<RunningScript> script) {
        if (!script) return;
        if (std::find(m_runningScripts.begin(), m_runningScripts.end(), script) != m_runningScripts.end()) return;
        m_runningScripts.push_back(std::move(script));
    }

    bool Server::RemoveRunningScript(const RunningScript* script) {
        auto it = std::find_if(m_runningScripts.begin(), m_runningScripts.end(),
            [script](const std::shared_ptr<RunningScript>& rs) { return rs.get() == script; });
        if (it == m_runningScripts.end()) return false;
        m_runningScripts.erase(it);
        return true;
    }

} // namespace WorkerHost
