#include "ScriptPromise.h"
#include "EventLoop.h"

namespace WorkerHost {

    std::shared_ptr<ScriptPromise> ScriptPromise::Create(EventLoop& loop) {
        return std::make_shared<ScriptPromise>(loop);
    }

    std::shared_ptr<ScriptPromise> ScriptPromise::MakeResolved(EventLoop& loop, Value value) {
        auto p = Create(loop);
        p->Resolve(std::move(value));
        return p;
    }

    std::shared_ptr<ScriptPromise> ScriptPromise::MakeRejected(EventLoop& loop, std::string reason) {
        auto p = Create(loop);
        p->Reject(std::move(reason));
        return p;
    }

    bool ScriptPromise::Resolve(Value value) {
        if (m_state != State::Pending) return false;
        m_state = State::Resolved;
        m_value = std::move(value);

        std::vector<SettledCallback> callbacks;
        callbacks.swap(m_callbacks);
        for (auto& cb : callbacks) Dispatch(std::move(cb));
        return true;
    }

    bool ScriptPromise::Reject(std::string reason) {
        if (m_state != State::Pending) return false;
        m_state = State::Rejected;
        m_reason = std::move(reason);

        std::vector<SettledCallback> callbacks;
        callbacks.swap(m_callbacks);
        for (auto& cb : callbacks) Dispatch(std::move(cb));
        return true;
    }

    void ScriptPromise::OnSettled(SettledCallback callback) {
        if (!callback) return;
        if (m_state == State::Pending) {
            m_callbacks.push_back(std::move(callback));
            return;
        }
        Dispatch(std::move(callback));
    }

    void ScriptPromise::Dispatch(SettledCallback callback) {
        std::shared_ptr<ScriptPromise> self = shared_from_this();
        m_loop.Post([self, callback]() { callback(*self); });
    }

} // namespace WorkerHost
