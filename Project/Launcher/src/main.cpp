#include "ProcessEngine.h"
#include "WorldSerializer.h"
#include "Settings/HostSettings.hpp"
#include "Logging.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

    struct LaunchOptions {
        std::string settingsPath = "workerhost.json";
        std::string worldPath;
        std::string savePath;
        std::string runTarget;                  // script@host
        std::vector<std::string> runArgs;
        int threads = 1;
        long long durationMs = 10000;
        bool fast = false;
    };

    void PrintUsage() {
        std::cout <<
            "usage: workerhost [options]\n"
            "  --settings <file>      host settings JSON (default workerhost.json)\n"
            "  --world <file>         world JSON with servers, scripts and running scripts\n"
            "  --run <script@host> [args...]\n"
            "                         start a script; arguments follow until the next option\n"
            "  --threads <n>          thread count for --run (default 1)\n"
            "  --duration <ms>        virtual time to simulate (default 10000)\n"
            "  --fast                 do not wait in real time between ticks\n"
            "  --save <file>          write the world back when the run ends\n";
    }

    bool ParseOptions(int argc, char** argv, LaunchOptions& out) {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto next = [&](std::string& value) {
                if (i + 1 >= argc) {
                    std::cerr << "missing value for " << arg << "\n";
                    return false;
                }
                value = argv[++i];
                return true;
            };

            std::string value;
            if (arg == "--help" || arg == "-h") {
                PrintUsage();
                std::exit(0);
            }
            else if (arg == "--settings") { if (!next(out.settingsPath)) return false; }
            else if (arg == "--world")    { if (!next(out.worldPath)) return false; }
            else if (arg == "--save")     { if (!next(out.savePath)) return false; }
            else if (arg == "--fast")     { out.fast = true; }
            else if (arg == "--threads") {
                if (!next(value)) return false;
                out.threads = std::atoi(value.c_str());
            }
            else if (arg == "--duration") {
                if (!next(value)) return false;
                out.durationMs = std::atoll(value.c_str());
            }
            else if (arg == "--run") {
                if (!next(out.runTarget)) return false;
                while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                    out.runArgs.push_back(argv[++i]);
                }
            }
            else {
                std::cerr << "unknown option " << arg << "\n";
                return false;
            }
        }
        return true;
    }

    // Numeric command-line arguments are passed to scripts as numbers.
    WorkerHost::Value ParseScriptArg(const std::string& text) {
        char* end = nullptr;
        double number = std::strtod(text.c_str(), &end);
        if (!text.empty() && end && *end == '\0') return WorkerHost::Value(number);
        if (text == "true") return WorkerHost::Value(true);
        if (text == "false") return WorkerHost::Value(false);
        return WorkerHost::Value(text);
    }

    class ConsoleNotifier : public WorkerHost::IUserNotifier {
    public:
        void Notify(const std::string& message) override {
            std::cout << "\n==== NOTICE ====\n" << message << "\n================\n";
            HOST_LOG_WARN("[Notice] " + message);
        }
        void Terminal(const std::string& line) override {
            std::cout << line << "\n";
        }
    };

    bool StartRequested(WorkerHost::ProcessEngine& engine, const LaunchOptions& options) {
        const size_t at = options.runTarget.find('@');
        const std::string script = options.runTarget.substr(0, at);
        const std::string host = at == std::string::npos ? "home" : options.runTarget.substr(at + 1);

        WorkerHost::Server* server = engine.FindServer(host);
        if (!server) {
            HOST_LOG_ERROR("[Launcher] unknown server '" + host + "'");
            return false;
        }
        const WorkerHost::Script* source = server->FindScript(script);
        if (!source) {
            HOST_LOG_ERROR("[Launcher] no script '" + script + "' on " + host);
            return false;
        }

        WorkerHost::ValueList args;
        for (const auto& a : options.runArgs) args.push_back(ParseScriptArg(a));

        auto record = std::make_shared<WorkerHost::RunningScript>(*source, std::move(args));
        record->threads = options.threads;
        const WorkerHost::ProcessId pid = engine.StartProcess(record, *server);
        if (pid == WorkerHost::InvalidProcessId) return false;

        HOST_PRINT(HostLogging::LogLevel::Info, "[Launcher] started ", script, "@", host, " as pid ", pid);
        return true;
    }

    void PrintSummary(WorkerHost::ProcessEngine& engine) {
        std::cout << "\n=== Servers ===\n";
        for (const auto& server : engine.Servers()) {
            std::cout << server->Hostname() << "  RAM " << server->Ram().Reserved() << "/" << server->Ram().Total()
                      << "GB  running " << server->RunningScripts().size() << "\n";
            for (const auto& record : server->RunningScripts()) {
                std::cout << "  [" << record->GetPid() << "] " << record->filename << " "
                          << WorkerHost::ArrayToString(record->args) << " t=" << record->threads
                          << " online " << record->onlineRunningTime << "s\n";
                for (const auto& line : record->logs) {
                    std::cout << "      " << line << "\n";
                }
            }
        }
    }

} // namespace

int main(int argc, char** argv) {
    LaunchOptions options;
    if (!ParseOptions(argc, argv, options)) {
        PrintUsage();
        return 1;
    }

    HostSettingsData settings;
    if (!HostSettings::LoadFromFile(options.settingsPath, settings)) {
        settings = HostSettings::Defaults();
    }
    if (!HostLogging::Initialize(settings)) {
        std::cerr << "logging could not be initialized, continuing with console output only\n";
    }

    HOST_PRINT("=== WORKER HOST ===");

    WorkerHost::ProcessEngine engine(settings, std::make_shared<ConsoleNotifier>());

    std::vector<WorkerHost::ServerPtr> servers;
    if (!options.worldPath.empty()) {
        if (!WorkerHost::WorldSerializer::LoadFromFile(options.worldPath, servers)) {
            HostLogging::Shutdown();
            return 1;
        }
    }
    else {
        servers.push_back(std::make_shared<WorkerHost::Server>("home", 8.0));
    }

    engine.RehydrateFromPersisted(servers, [](WorkerHost::RunningScript& script, WorkerHost::Server& server) {
        HOST_PRINT(HostLogging::LogLevel::Debug, "[Launcher] resumed ", script.filename, " on ", server.Hostname(),
                   " (offline ", script.offlineRunningTime, "s)");
    });

    if (!options.runTarget.empty() && !StartRequested(engine, options)) {
        HOST_LOG_ERROR("[Launcher] could not start " + options.runTarget);
    }

    const int cycleMs = settings.idleSpeedMs;
    long long elapsed = 0;
    while (elapsed < options.durationMs) {
        engine.Tick(cycleMs);
        engine.UpdateOnlineScriptTimes(1);
        elapsed += cycleMs;

        if (engine.LiveProcesses().empty() && engine.Loop().Empty()) break;
        if (!options.fast) {
            std::this_thread::sleep_for(std::chrono::milliseconds(cycleMs));
        }
    }

    PrintSummary(engine);

    int exitCode = 0;
    if (!options.savePath.empty() && !WorkerHost::WorldSerializer::SaveToFile(options.savePath, engine.Servers())) {
        exitCode = 1;
    }

    HOST_PRINT("=== Worker host stopped ===");
    HostLogging::Shutdown();
    return exitCode;
}
