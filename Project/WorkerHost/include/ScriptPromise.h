#pragma once
// ScriptPromise.h
//
// Settle-once result of a multi-tick host function (sleep, hack, prompt, ...).
// Callbacks never run inline: settling posts them to the EventLoop in registration order,
// and registering on an already-settled promise posts the callback right away.
//
// Always create through ScriptPromise::Create so callbacks can keep the promise alive.

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "Value.h"

namespace WorkerHost {

    class EventLoop;

    class ScriptPromise : public std::enable_shared_from_this<ScriptPromise> {
    public:
        enum class State : uint8_t {
            Pending = 0,
            Resolved,
            Rejected
        };

        using SettledCallback = std::function<void(const ScriptPromise&)>;

        static std::shared_ptr<ScriptPromise> Create(EventLoop& loop);
        static std::shared_ptr<ScriptPromise> MakeResolved(EventLoop& loop, Value value);
        static std::shared_ptr<ScriptPromise> MakeRejected(EventLoop& loop, std::string reason);

        explicit ScriptPromise(EventLoop& loop) : m_loop(loop) {}

        // Return false when the promise was already settled.
        bool Resolve(Value value);
        bool Reject(std::string reason);

        void OnSettled(SettledCallback callback);

        State GetState() const { return m_state; }
        bool IsPending() const { return m_state == State::Pending; }
        bool IsResolved() const { return m_state == State::Resolved; }
        bool IsRejected() const { return m_state == State::Rejected; }
        const Value& GetValue() const { return m_value; }
        const std::string& GetReason() const { return m_reason; }

    private:
        void Dispatch(SettledCallback callback);

        EventLoop& m_loop;
        State m_state = State::Pending;
        Value m_value;
        std::string m_reason;
        std::vector<SettledCallback> m_callbacks;
    };

    using PromisePtr = std::shared_ptr<ScriptPromise>;

} // namespace WorkerHost
