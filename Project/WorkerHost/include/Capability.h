#pragma once
// Capability.h
//
// Catalogue of the host functions a guest script can call. Each entry names the guest-visible
// function, whether it completes over multiple ticks (returns a promise / blocks the stepper),
// whether it bypasses the call serializer, and who implements it.
//
// Game capabilities are delegated to an IGameFunctions provider and are only bound into a
// process environment when a provider is installed on the engine.

#include <array>
#include <cstdint>
#include <memory>
#include <string>

#include "Value.h"
#include "ScriptPromise.h"

namespace WorkerHost {

    class EventLoop;
    class WorkerScript;

    enum class Capability : uint8_t {
        Hack = 0,
        Grow,
        Weaken,
        Sleep,
        Prompt,
        Print,
        Tprint,
        Run,
        Exec,
        Exit,
        GetHostname,
        GetScriptName,
        WritePort,
        ReadPort,
        PeekPort,
        ClearPort,
        GetServer,
        Count
    };

    enum class CallKind : uint8_t {
        Action = 0, // settles later, through a ScriptPromise
        Query       // returns immediately
    };

    enum class CapabilityProvider : uint8_t {
        Engine = 0,
        Game
    };

    struct CapabilityDescriptor {
        Capability id;
        const char* name;
        CallKind kind;
        bool sleepExempt;
        CapabilityProvider provider;
    };

    static constexpr size_t CapabilityCount = static_cast<size_t>(Capability::Count);

    const CapabilityDescriptor& Describe(Capability capability);
    const std::array<CapabilityDescriptor, CapabilityCount>& AllCapabilities();
    // nullptr if no capability has that guest name
    const CapabilityDescriptor* FindCapability(const std::string& name);

    // What a host function hands back: either an immediate value or a pending promise.
    struct HostCallResult {
        Value value;
        PromisePtr promise;

        bool IsAsync() const { return promise != nullptr; }

        static HostCallResult Immediate(Value v) { HostCallResult r; r.value = std::move(v); return r; }
        static HostCallResult Deferred(PromisePtr p) { HostCallResult r; r.promise = std::move(p); return r; }
    };

    // Game-side implementation of hack/grow/weaken/prompt/getServer.
    // BeginAction must return a promise created on the given loop.
    class IGameFunctions {
    public:
        virtual ~IGameFunctions() = default;
        virtual PromisePtr BeginAction(Capability capability, WorkerScript& ws, const ValueList& args, EventLoop& loop) = 0;
        virtual Value Query(Capability capability, WorkerScript& ws, const ValueList& args) = 0;
    };

} // namespace WorkerHost
