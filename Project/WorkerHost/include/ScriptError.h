#pragma once
// ScriptError.h
//
// Error model of the worker host.
//
// Exceptions thrown by host code:
//   - ScriptRuntimeError       a host function rejected its arguments / state; becomes a guest error.
//   - StopSignal               the process was asked to stop; unwinds the guest without a crash report.
//   - ConcurrentCallViolation  a native-mode process started a second host call while one was in flight.
//
// Termination reasons (why a process stopped, handed to the completion pipeline):
//   AlreadyTerminated | RuntimeErrorMessage | NativeFault | Unrecognized
//
// Runtime error messages travel as one string: "RUNTIME_ERROR|<hostname>|<script>|<message>".
// Any '|' inside a field is replaced by '/' when the message is built, so a well-formed message
// always splits into exactly four fields.
//
// Lua helpers:
//   FormatLuaError     error object + traceback, for host-side diagnostics.
//   ProtectedToString  string form of a guest value without letting guest metamethods escape.
//   MapErrorPosition   rewrites "<chunk>:<line>:" positions to account for inlined import code.

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

extern "C" {
    struct lua_State;
}

namespace WorkerHost {

    class ScriptRuntimeError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class StopSignal : public std::exception {
    public:
        const char* what() const noexcept override { return "script stopped"; }
    };

    class ConcurrentCallViolation : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct AlreadyTerminated {};

    struct RuntimeErrorMessage {
        std::string text; // full "RUNTIME_ERROR|host|script|message" string
    };

    struct NativeFault {
        std::string what;
    };

    struct Unrecognized {
        std::string description;
    };

    using TerminationReason = std::variant<AlreadyTerminated, RuntimeErrorMessage, NativeFault, Unrecognized>;

    // Short human-readable form, for logs.
    std::string DescribeReason(const TerminationReason& reason);

    namespace Error {

        extern const char* const RuntimeErrorTag;

        struct RuntimeErrorFields {
            std::string hostname;
            std::string scriptName;
            std::string message;
        };

        std::string MakeRuntimeErrorMessage(const std::string& hostname, const std::string& scriptName, const std::string& message);

        bool IsRuntimeErrorMessage(const std::string& text);

        // std::nullopt unless 'text' is a well-formed runtime error message.
        std::optional<RuntimeErrorFields> ParseRuntimeErrorMessage(const std::string& text);

        // Format a Lua error object (at the top of L's stack) into a message with a traceback.
        // Leaves the stack balanced.
        std::string FormatLuaError(lua_State* L, int err);

        // String form of the value at index. Strings and numbers convert directly; anything else
        // goes through luaL_tolstring under lua_pcall with an instruction budget, so a guest
        // __tostring cannot raise past the host or loop forever. False when conversion failed.
        // Leaves the stack balanced.
        bool ProtectedToString(lua_State* L, int index, std::string& out);

        // Shift every "<chunkName>:<n>:" occurrence in message by -lineOffset.
        // Lines that fall inside inlined import code (n - lineOffset < 1) are left as-is.
        std::string MapErrorPosition(const std::string& message, const std::string& chunkName, int lineOffset);

    } // namespace Error
} // namespace WorkerHost
