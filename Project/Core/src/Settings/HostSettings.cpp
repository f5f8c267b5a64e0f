#include "Settings/HostSettings.hpp"
#include "Logging.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"

#include <fstream>
#include <filesystem>
#include <algorithm>

namespace {

    void ReadInt(const rapidjson::Document& doc, const char* key, int& out, int lo, int hi) {
        if (doc.HasMember(key) && doc[key].IsNumber()) {
            out = static_cast<int>(std::clamp(doc[key].GetDouble(), static_cast<double>(lo), static_cast<double>(hi)));
        }
    }

} // namespace

bool HostSettings::LoadFromFile(const std::string& filePath, HostSettingsData& out) {
    namespace fs = std::filesystem;

    if (!fs::exists(filePath)) {
        HOST_LOG_INFO("[HostSettings] No settings file at " + filePath + ", using defaults");
        return false;
    }

    std::ifstream inFile(filePath, std::ios::binary);
    if (!inFile.is_open()) {
        HOST_LOG_ERROR("[HostSettings] Failed to open file: " + filePath);
        return false;
    }

    std::string jsonContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
    inFile.close();

    if (!LoadFromString(jsonContent, out)) {
        HOST_LOG_ERROR("[HostSettings] JSON parse error in: " + filePath);
        return false;
    }

    HOST_LOG_INFO("[HostSettings] Loaded settings from: " + filePath);
    return true;
}

bool HostSettings::LoadFromString(const std::string& json, HostSettingsData& out) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError() || !doc.IsObject()) {
        return false;
    }

    HostSettingsData loaded = out;

    ReadInt(doc, "instructionTimeSliceMs", loaded.instructionTimeSliceMs, 1, 60000);
    ReadInt(doc, "instructionsPerStep", loaded.instructionsPerStep, 1, 1000000);
    ReadInt(doc, "idleSpeedMs", loaded.idleSpeedMs, 1, 60000);
    ReadInt(doc, "maxConcurrentProcesses", loaded.maxConcurrentProcesses, 1, 1000000);
    ReadInt(doc, "numPorts", loaded.numPorts, 1, 1000);
    ReadInt(doc, "maxPortCapacity", loaded.maxPortCapacity, 1, 100000);
    ReadInt(doc, "maxLogCapacity", loaded.maxLogCapacity, 1, 100000);

    if (doc.HasMember("maxPid") && doc["maxPid"].IsNumber()) {
        loaded.maxPid = static_cast<int32_t>(std::clamp(doc["maxPid"].GetDouble(), 1.0, 2147483647.0));
    }
    if (doc.HasMember("logLevel") && doc["logLevel"].IsString()) {
        loaded.logLevel = doc["logLevel"].GetString();
    }
    if (doc.HasMember("logDirectory") && doc["logDirectory"].IsString()) {
        loaded.logDirectory = doc["logDirectory"].GetString();
    }
    if (doc.HasMember("skipScriptLoad") && doc["skipScriptLoad"].IsBool()) {
        loaded.skipScriptLoad = doc["skipScriptLoad"].GetBool();
    }

    out = loaded;
    return true;
}

std::string HostSettings::ToJson(const HostSettingsData& data) {
    rapidjson::Document doc;
    doc.SetObject();
    rapidjson::Document::AllocatorType& alloc = doc.GetAllocator();

    doc.AddMember("instructionTimeSliceMs", data.instructionTimeSliceMs, alloc);
    doc.AddMember("instructionsPerStep", data.instructionsPerStep, alloc);
    doc.AddMember("idleSpeedMs", data.idleSpeedMs, alloc);
    doc.AddMember("maxConcurrentProcesses", data.maxConcurrentProcesses, alloc);
    doc.AddMember("maxPid", data.maxPid, alloc);
    doc.AddMember("numPorts", data.numPorts, alloc);
    doc.AddMember("maxPortCapacity", data.maxPortCapacity, alloc);
    doc.AddMember("maxLogCapacity", data.maxLogCapacity, alloc);
    doc.AddMember("logLevel", rapidjson::Value(data.logLevel.c_str(), alloc), alloc);
    doc.AddMember("logDirectory", rapidjson::Value(data.logDirectory.c_str(), alloc), alloc);
    doc.AddMember("skipScriptLoad", data.skipScriptLoad, alloc);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

bool HostSettings::SaveToFile(const std::string& filePath, const HostSettingsData& data) {
    namespace fs = std::filesystem;

    fs::path parentDir = fs::path(filePath).parent_path();
    if (!parentDir.empty() && !fs::exists(parentDir)) {
        std::error_code ec;
        fs::create_directories(parentDir, ec);
        if (ec) {
            HOST_LOG_ERROR("[HostSettings] Failed to create directory: " + parentDir.string());
            return false;
        }
    }

    std::ofstream outFile(filePath, std::ios::binary);
    if (!outFile.is_open()) {
        HOST_LOG_ERROR("[HostSettings] Failed to open file for writing: " + filePath);
        return false;
    }

    outFile << ToJson(data);
    outFile.close();

    HOST_LOG_DEBUG("[HostSettings] Saved settings to: " + filePath);
    return true;
}
