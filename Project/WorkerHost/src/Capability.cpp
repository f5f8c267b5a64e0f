#include "Capability.h"

namespace WorkerHost {

    namespace {
        using K = CallKind;
        using P = CapabilityProvider;

        const std::array<CapabilityDescriptor, CapabilityCount> kCapabilities = { {
            { Capability::Hack,          "hack",          K::Action, false, P::Game },
            { Capability::Grow,          "grow",          K::Action, false, P::Game },
            { Capability::Weaken,        "weaken",        K::Action, false, P::Game },
            { Capability::Sleep,         "sleep",         K::Action, true,  P::Engine },
            { Capability::Prompt,        "prompt",        K::Action, false, P::Game },
            { Capability::Print,         "print",         K::Query,  false, P::Engine },
            { Capability::Tprint,        "tprint",        K::Query,  false, P::Engine },
            { Capability::Run,           "run",           K::Query,  false, P::Engine },
            { Capability::Exec,          "exec",          K::Query,  false, P::Engine },
            { Capability::Exit,          "exit",          K::Query,  false, P::Engine },
            { Capability::GetHostname,   "getHostname",   K::Query,  false, P::Engine },
            { Capability::GetScriptName, "getScriptName", K::Query,  false, P::Engine },
            { Capability::WritePort,     "writePort",     K::Query,  false, P::Engine },
            { Capability::ReadPort,      "readPort",      K::Query,  false, P::Engine },
            { Capability::PeekPort,      "peekPort",      K::Query,  false, P::Engine },
            { Capability::ClearPort,     "clearPort",     K::Query,  false, P::Engine },
            { Capability::GetServer,     "getServer",     K::Query,  false, P::Game },
        } };
    }

    const CapabilityDescriptor& Describe(Capability capability) {
        return kCapabilities[static_cast<size_t>(capability)];
    }

    const std::array<CapabilityDescriptor, CapabilityCount>& AllCapabilities() {
        return kCapabilities;
    }

    const CapabilityDescriptor* FindCapability(const std::string& name) {
        for (const auto& d : kCapabilities) {
            if (name == d.name) return &d;
        }
        return nullptr;
    }

} // namespace WorkerHost
