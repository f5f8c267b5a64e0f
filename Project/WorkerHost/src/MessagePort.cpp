#include "MessagePort.h"

namespace WorkerHost {

    const char* const MessagePort::EmptyPortData = "NULL PORT DATA";

    std::optional<Value> MessagePort::Write(Value data) {
        m_data.push_back(std::move(data));
        if (m_data.size() > m_capacity) {
            Value dropped = std::move(m_data.front());
            m_data.pop_front();
            return dropped;
        }
        return std::nullopt;
    }

    Value MessagePort::Read() {
        if (m_data.empty()) return Value(EmptyPortData);
        Value front = std::move(m_data.front());
        m_data.pop_front();
        return front;
    }

    Value MessagePort::Peek() const {
        if (m_data.empty()) return Value(EmptyPortData);
        return m_data.front();
    }

} // namespace WorkerHost
