#include "WorldSerializer.h"
#include "Logging.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace WorkerHost {

    namespace {

        constexpr int kMaxValueDepth = 32;

        Value FromJson(const rapidjson::Value& json, int depth = 0) {
            if (depth > kMaxValueDepth) return Value();

            if (json.IsBool()) return Value(json.GetBool());
            if (json.IsNumber()) return Value(json.GetDouble());
            if (json.IsString()) return Value(std::string(json.GetString(), json.GetStringLength()));
            if (json.IsArray()) {
                Value array = Value::MakeArray();
                for (const auto& item : json.GetArray()) {
                    array.Push(FromJson(item, depth + 1));
                }
                return array;
            }
            if (json.IsObject()) {
                Value object = Value::MakeObject();
                for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
                    object.Set(it->name.GetString(), FromJson(it->value, depth + 1));
                }
                return object;
            }
            return Value();
        }

        rapidjson::Value ToJson(const Value& value, rapidjson::Document::AllocatorType& alloc) {
            switch (value.GetType()) {
            case Value::Type::Boolean:
                return rapidjson::Value(value.AsBool());
            case Value::Type::Number:
                return rapidjson::Value(value.AsNumber());
            case Value::Type::String:
                return rapidjson::Value(value.AsString().c_str(),
                                        static_cast<rapidjson::SizeType>(value.AsString().size()), alloc);
            case Value::Type::Array: {
                rapidjson::Value array(rapidjson::kArrayType);
                for (const auto& item : value.Items()) {
                    array.PushBack(ToJson(item, alloc), alloc);
                }
                return array;
            }
            case Value::Type::Object: {
                rapidjson::Value object(rapidjson::kObjectType);
                for (size_t i = 0; i < value.Keys().size(); ++i) {
                    object.AddMember(rapidjson::Value(value.Keys()[i].c_str(), alloc),
                                     ToJson(value.Items()[i], alloc), alloc);
                }
                return object;
            }
            case Value::Type::Nil:
                break;
            }
            return rapidjson::Value(rapidjson::kNullType);
        }

        double ReadDouble(const rapidjson::Value& obj, const char* key, double fallback = 0.0) {
            if (obj.HasMember(key) && obj[key].IsNumber()) return obj[key].GetDouble();
            return fallback;
        }

        std::string ReadString(const rapidjson::Value& obj, const char* key) {
            if (obj.HasMember(key) && obj[key].IsString()) return obj[key].GetString();
            return {};
        }

        bool ReadFile(const std::filesystem::path& path, std::string& out) {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open()) return false;
            out.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            return true;
        }

        bool LoadScript(const rapidjson::Value& json, const std::string& baseDirectory, Script& out) {
            out.filename = ReadString(json, "filename");
            if (out.filename.empty()) {
                HOST_LOG_ERROR("[WorldSerializer] script entry without a filename");
                return false;
            }
            out.ramUsage = ReadDouble(json, "ramUsage");

            if (json.HasMember("code") && json["code"].IsString()) {
                out.code = json["code"].GetString();
                return true;
            }
            const std::string relative = ReadString(json, "path");
            if (relative.empty()) {
                HOST_LOG_ERROR("[WorldSerializer] " + out.filename + " has neither code nor path");
                return false;
            }
            std::filesystem::path full = std::filesystem::path(baseDirectory) / relative;
            if (!ReadFile(full, out.code)) {
                HOST_LOG_ERROR("[WorldSerializer] Failed to read script source: " + full.string());
                return false;
            }
            return true;
        }

        std::shared_ptr<RunningScript> LoadRunningScript(const rapidjson::Value& json, const Server& server) {
            auto record = std::make_shared<RunningScript>();
            record->filename = ReadString(json, "filename");
            record->hostname = server.Hostname();
            if (json.HasMember("args") && json["args"].IsArray()) {
                record->args = FromJson(json["args"]).Items();
            }
            double threads = ReadDouble(json, "threads", 1.0);
            if (std::isnan(threads)) threads = 1.0;
            record->threads = static_cast<int>(std::clamp(threads, 1.0, 2147483647.0));

            if (const Script* script = server.FindScript(record->filename)) {
                record->ramUsage = script->ramUsage;
            }
            else {
                record->ramUsage = ReadDouble(json, "ramUsage");
            }

            record->onlineRunningTime = ReadDouble(json, "onlineRunningTime");
            record->onlineMoneyMade = ReadDouble(json, "onlineMoneyMade");
            record->onlineExpGained = ReadDouble(json, "onlineExpGained");
            record->offlineRunningTime = ReadDouble(json, "offlineRunningTime");
            record->offlineMoneyMade = ReadDouble(json, "offlineMoneyMade");
            record->offlineExpGained = ReadDouble(json, "offlineExpGained");

            if (json.HasMember("logs") && json["logs"].IsArray()) {
                for (const auto& line : json["logs"].GetArray()) {
                    if (line.IsString()) record->logs.push_back(line.GetString());
                }
            }
            return record;
        }

    } // namespace

    bool WorldSerializer::LoadFromFile(const std::string& filePath, std::vector<ServerPtr>& out) {
        namespace fs = std::filesystem;

        if (!fs::exists(filePath)) {
            HOST_LOG_ERROR("[WorldSerializer] No world file at " + filePath);
            return false;
        }

        std::string json;
        if (!ReadFile(filePath, json)) {
            HOST_LOG_ERROR("[WorldSerializer] Failed to open file: " + filePath);
            return false;
        }

        if (!LoadFromString(json, out, fs::path(filePath).parent_path().string())) {
            HOST_LOG_ERROR("[WorldSerializer] Invalid world file: " + filePath);
            return false;
        }

        HOST_PRINT(HostLogging::LogLevel::Info, "[WorldSerializer] Loaded ", out.size(), " servers from: ", filePath);
        return true;
    }

    bool WorldSerializer::LoadFromString(const std::string& json, std::vector<ServerPtr>& out,
                                         const std::string& baseDirectory) {
        rapidjson::Document doc;
        doc.Parse(json.c_str());

        if (doc.HasParseError() || !doc.IsObject() || !doc.HasMember("servers") || !doc["servers"].IsArray()) {
            return false;
        }

        std::vector<ServerPtr> loaded;
        for (const auto& entry : doc["servers"].GetArray()) {
            if (!entry.IsObject()) return false;

            const std::string hostname = ReadString(entry, "hostname");
            if (hostname.empty()) {
                HOST_LOG_ERROR("[WorldSerializer] server entry without a hostname");
                return false;
            }
            bool admin = true;
            if (entry.HasMember("hasAdminRights") && entry["hasAdminRights"].IsBool()) {
                admin = entry["hasAdminRights"].GetBool();
            }
            auto server = std::make_shared<Server>(hostname, ReadDouble(entry, "maxRam"), admin);

            if (entry.HasMember("scripts") && entry["scripts"].IsArray()) {
                for (const auto& scriptJson : entry["scripts"].GetArray()) {
                    if (!scriptJson.IsObject()) return false;
                    Script script;
                    if (!LoadScript(scriptJson, baseDirectory, script)) return false;
                    server->AddScript(std::move(script));
                }
            }

            if (entry.HasMember("runningScripts") && entry["runningScripts"].IsArray()) {
                for (const auto& runningJson : entry["runningScripts"].GetArray()) {
                    if (!runningJson.IsObject()) return false;
                    server->AddRunningScript(LoadRunningScript(runningJson, *server));
                }
            }

            loaded.push_back(std::move(server));
        }

        out = std::move(loaded);
        return true;
    }

    std::string WorldSerializer::SaveToString(const std::vector<ServerPtr>& servers) {
        rapidjson::Document doc;
        doc.SetObject();
        rapidjson::Document::AllocatorType& alloc = doc.GetAllocator();

        rapidjson::Value serverArray(rapidjson::kArrayType);
        for (const auto& server : servers) {
            if (!server) continue;

            rapidjson::Value entry(rapidjson::kObjectType);
            entry.AddMember("hostname", rapidjson::Value(server->Hostname().c_str(), alloc), alloc);
            entry.AddMember("maxRam", server->Ram().Total(), alloc);
            entry.AddMember("hasAdminRights", server->HasAdminRights(), alloc);

            rapidjson::Value scripts(rapidjson::kArrayType);
            for (const auto& script : server->Scripts()) {
                rapidjson::Value s(rapidjson::kObjectType);
                s.AddMember("filename", rapidjson::Value(script.filename.c_str(), alloc), alloc);
                s.AddMember("code", rapidjson::Value(script.code.c_str(),
                            static_cast<rapidjson::SizeType>(script.code.size()), alloc), alloc);
                s.AddMember("ramUsage", script.ramUsage, alloc);
                scripts.PushBack(s, alloc);
            }
            entry.AddMember("scripts", scripts, alloc);

            rapidjson::Value running(rapidjson::kArrayType);
            for (const auto& record : server->RunningScripts()) {
                rapidjson::Value r(rapidjson::kObjectType);
                r.AddMember("filename", rapidjson::Value(record->filename.c_str(), alloc), alloc);
                r.AddMember("args", ToJson(Value::MakeArray(record->args), alloc), alloc);
                r.AddMember("threads", record->threads, alloc);
                r.AddMember("ramUsage", record->ramUsage, alloc);
                r.AddMember("onlineRunningTime", record->onlineRunningTime, alloc);
                r.AddMember("onlineMoneyMade", record->onlineMoneyMade, alloc);
                r.AddMember("onlineExpGained", record->onlineExpGained, alloc);
                r.AddMember("offlineRunningTime", record->offlineRunningTime, alloc);
                r.AddMember("offlineMoneyMade", record->offlineMoneyMade, alloc);
                r.AddMember("offlineExpGained", record->offlineExpGained, alloc);

                rapidjson::Value logs(rapidjson::kArrayType);
                for (const auto& line : record->logs) {
                    logs.PushBack(rapidjson::Value(line.c_str(), alloc), alloc);
                }
                r.AddMember("logs", logs, alloc);
                running.PushBack(r, alloc);
            }
            entry.AddMember("runningScripts", running, alloc);

            serverArray.PushBack(entry, alloc);
        }
        doc.AddMember("servers", serverArray, alloc);

        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
        return std::string(buffer.GetString(), buffer.GetSize());
    }

    bool WorldSerializer::SaveToFile(const std::string& filePath, const std::vector<ServerPtr>& servers) {
        namespace fs = std::filesystem;

        fs::path parentDir = fs::path(filePath).parent_path();
        if (!parentDir.empty() && !fs::exists(parentDir)) {
            std::error_code ec;
            fs::create_directories(parentDir, ec);
            if (ec) {
                HOST_LOG_ERROR("[WorldSerializer] Failed to create directory: " + parentDir.string());
                return false;
            }
        }

        std::ofstream outFile(filePath, std::ios::binary);
        if (!outFile.is_open()) {
            HOST_LOG_ERROR("[WorldSerializer] Failed to open file for writing: " + filePath);
            return false;
        }

        outFile << SaveToString(servers);
        outFile.close();

        HOST_PRINT(HostLogging::LogLevel::Info, "[WorldSerializer] Saved ", servers.size(), " servers to: ", filePath);
        return true;
    }

} // namespace WorkerHost
