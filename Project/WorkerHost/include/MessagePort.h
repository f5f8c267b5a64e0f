#pragma once
// MessagePort.h
//
// Bounded FIFO shared between processes (writePort/readPort/peekPort/clearPort).
// Writing to a full port drops and returns the oldest entry. Reading an empty port yields
// the "NULL PORT DATA" string.

#include <deque>
#include <optional>

#include "Value.h"

namespace WorkerHost {

    class MessagePort {
    public:
        static const char* const EmptyPortData;

        explicit MessagePort(size_t capacity = 50) : m_capacity(capacity == 0 ? 1 : capacity) {}

        std::optional<Value> Write(Value data);
        Value Read();
        Value Peek() const;
        void Clear() { m_data.clear(); }

        bool Empty() const { return m_data.empty(); }
        bool Full() const { return m_data.size() >= m_capacity; }
        size_t Size() const { return m_data.size(); }
        size_t Capacity() const { return m_capacity; }

    private:
        std::deque<Value> m_data;
        size_t m_capacity;
    };

} // namespace WorkerHost
