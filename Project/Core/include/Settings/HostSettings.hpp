#pragma once

#include <string>
#include <cstdint>

#include "Logging.hpp"

// HostSettingsData - tunables for the process engine and the ambient services
struct HostSettingsData {
    // Scheduling
    int instructionTimeSliceMs = 50;     // delay between two legacy-mode steps
    int instructionsPerStep = 100;       // Lua VM instructions executed per legacy-mode step
    int idleSpeedMs = 200;               // duration of one accounting cycle

    // Process table
    int maxConcurrentProcesses = 1000;   // bound on the pid search
    int32_t maxPid = 2147483647;         // pids wrap back to 1 after this value

    // Ports and logs
    int numPorts = 20;
    int maxPortCapacity = 50;
    int maxLogCapacity = 50;

    // Logging
    std::string logLevel = "info";
    std::string logDirectory = "logs";

    // Rehydration
    bool skipScriptLoad = false;
};

// HostSettings - JSON (de)serialization of HostSettingsData
//
// Missing keys keep their defaults, out-of-range values are clamped.
// Load functions return false on I/O or parse errors and leave 'out' untouched in that case.
class WORKERHOST_API HostSettings {
public:
    static bool LoadFromFile(const std::string& filePath, HostSettingsData& out);
    static bool LoadFromString(const std::string& json, HostSettingsData& out);
    static bool SaveToFile(const std::string& filePath, const HostSettingsData& data);

    static std::string ToJson(const HostSettingsData& data);

    static HostSettingsData Defaults() { return HostSettingsData{}; }
};
