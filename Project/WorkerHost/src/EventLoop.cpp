#include "EventLoop.h"

namespace WorkerHost {

    int64_t EventLoop::After(int64_t delayMs) const {
        if (delayMs <= 0) return m_now;
        if (delayMs > MaxTime - m_now) return MaxTime;
        return m_now + delayMs;
    }

    EventLoop::TaskId EventLoop::Schedule(int64_t delayMs, Task task) {
        const TaskId id = m_nextId++;
        const int64_t due = After(delayMs);
        m_tasks.emplace(Key{ due, id }, std::move(task));
        m_dueById.emplace(id, due);
        return id;
    }

    bool EventLoop::Cancel(TaskId id) {
        auto it = m_dueById.find(id);
        if (it == m_dueById.end()) return false;
        m_tasks.erase(Key{ it->second, id });
        m_dueById.erase(it);
        return true;
    }

    bool EventLoop::RunNextDueBy(int64_t limit) {
        if (m_tasks.empty()) return false;
        auto it = m_tasks.begin();
        if (it->first.first > limit) return false;

        const int64_t due = it->first.first;
        Task task = std::move(it->second);
        m_dueById.erase(it->first.second);
        m_tasks.erase(it);

        if (due > m_now) m_now = due;
        if (task) task();
        return true;
    }

    void EventLoop::Tick(int64_t dtMs) {
        const int64_t target = After(dtMs);
        while (RunNextDueBy(target)) {}
        m_now = target;
    }

    size_t EventLoop::RunPending() {
        size_t count = 0;
        while (RunNextDueBy(m_now)) ++count;
        return count;
    }

    bool EventLoop::RunUntilIdle(int64_t maxMs) {
        const int64_t deadline = After(maxMs);
        while (RunNextDueBy(deadline)) {}
        if (m_tasks.empty()) return true;
        m_now = deadline;
        return false;
    }

    void EventLoop::Clear() {
        // Tasks may own objects whose destructors schedule more work; swap first.
        std::map<Key, Task> dropped;
        dropped.swap(m_tasks);
        m_dueById.clear();
        dropped.clear();
        m_tasks.clear();
        m_dueById.clear();
    }

} // namespace WorkerHost
