#pragma once
// File: Tests/TestSupport.h
// Purpose: Shared fixtures for the worker host tests: a recording notifier, a scripted game
//          provider and helpers to stand up servers and launch scripts.
// Ownership/Lifetime: Helpers return shared_ptrs; tests own engines and servers.

#include "ProcessEngine.h"
#include "EventLoop.h"
#include "ScriptPromise.h"
#include "Server.h"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace WorkerHostTest {

    using namespace WorkerHost;

    class RecordingNotifier : public IUserNotifier {
    public:
        void Notify(const std::string& message) override { notices.push_back(message); }
        void Terminal(const std::string& line) override { terminal.push_back(line); }

        bool Noticed(const std::string& fragment) const {
            return std::any_of(notices.begin(), notices.end(),
                [&](const std::string& n) { return n.find(fragment) != std::string::npos; });
        }

        std::vector<std::string> notices;
        std::vector<std::string> terminal;
    };

    // hack/grow/weaken settle after actionDelayMs with a fixed amount; prompt resolves to true;
    // getServer returns { hostname, maxRam }.
    class FakeGame : public IGameFunctions {
    public:
        PromisePtr BeginAction(Capability capability, WorkerScript& ws, const ValueList& args, EventLoop& loop) override {
            (void)ws;
            (void)args;
            ++actionsStarted;
            PromisePtr promise = ScriptPromise::Create(loop);
            if (capability == Capability::Prompt) {
                promise->Resolve(Value(true));
                return promise;
            }
            if (failActions) {
                loop.Schedule(actionDelayMs, [promise]() { promise->Reject("target is unreachable"); });
                return promise;
            }
            const double amount = capability == Capability::Hack ? 100.0 : 1.0;
            loop.Schedule(actionDelayMs, [this, promise, amount]() {
                ++actionsSettled;
                promise->Resolve(Value(amount));
            });
            return promise;
        }

        Value Query(Capability capability, WorkerScript& ws, const ValueList& args) override {
            (void)capability;
            (void)args;
            Value server = Value::MakeObject();
            server.Set("hostname", Value(ws.GetServer().Hostname()));
            server.Set("maxRam", Value(ws.GetServer().Ram().Total()));
            return server;
        }

        int64_t actionDelayMs = 1000;
        bool failActions = false;
        int actionsStarted = 0;
        int actionsSettled = 0;
    };

    // Small time slice so legacy scripts progress quickly in virtual time.
    inline HostSettingsData FastSettings() {
        HostSettingsData settings;
        settings.instructionTimeSliceMs = 1;
        settings.instructionsPerStep = 1000;
        return settings;
    }

    inline ServerPtr MakeServer(const std::string& hostname, double maxRam, bool admin = true) {
        return std::make_shared<Server>(hostname, maxRam, admin);
    }

    inline void AddScript(Server& server, const std::string& filename, const std::string& code, double ramUsage = 1.0) {
        server.AddScript(Script{ filename, code, ramUsage });
    }

    inline ProcessId Launch(ProcessEngine& engine, Server& server, const std::string& filename,
                            ValueList args = {}, int threads = 1) {
        const Script* script = server.FindScript(filename);
        if (!script) return InvalidProcessId;
        auto record = std::make_shared<RunningScript>(*script, std::move(args));
        record->threads = threads;
        return engine.StartProcess(record, server);
    }

    // Keeps the running-script record so its log can be inspected after the process ends.
    // The record's pid stays InvalidProcessId when the start was rejected.
    inline std::shared_ptr<RunningScript> LaunchRecord(ProcessEngine& engine, Server& server, const std::string& filename,
                                                       ValueList args = {}, int threads = 1) {
        const Script* script = server.FindScript(filename);
        if (!script) return nullptr;
        auto record = std::make_shared<RunningScript>(*script, std::move(args));
        record->threads = threads;
        engine.StartProcess(record, server);
        return record;
    }

    inline bool HasLog(const RunningScript& script, const std::string& fragment) {
        return std::any_of(script.logs.begin(), script.logs.end(),
            [&](const std::string& line) { return line.find(fragment) != std::string::npos; });
    }

} // namespace WorkerHostTest
