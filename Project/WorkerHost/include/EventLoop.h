#pragma once
// EventLoop.h
//
// Single-threaded timer queue on a virtual millisecond clock. All process steps,
// promise callbacks and sleep timers go through it, so nothing runs concurrently.
//
// Tasks with equal due time run in scheduling order. A task scheduled while Tick() is
// running executes in the same Tick() when it becomes due inside the advanced window.
// Due times saturate at MaxTime, so a huge delay means "never" rather than wrapping around.

#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <unordered_map>
#include <utility>

namespace WorkerHost {

    class EventLoop {
    public:
        using Task = std::function<void()>;
        using TaskId = uint64_t;

        static constexpr int64_t MaxTime = std::numeric_limits<int64_t>::max();

        EventLoop() = default;
        EventLoop(const EventLoop&) = delete;
        EventLoop& operator=(const EventLoop&) = delete;

        TaskId Schedule(int64_t delayMs, Task task);
        TaskId Post(Task task) { return Schedule(0, std::move(task)); }
        bool Cancel(TaskId id);

        // Advance the clock by dtMs, running everything that becomes due.
        void Tick(int64_t dtMs);

        // Run tasks already due without advancing the clock. Returns how many ran.
        size_t RunPending();

        // Jump from due task to due task until nothing is left or maxMs of virtual time passed.
        // Returns true when the queue drained.
        bool RunUntilIdle(int64_t maxMs);

        int64_t Now() const { return m_now; }
        size_t PendingCount() const { return m_tasks.size(); }
        bool Empty() const { return m_tasks.empty(); }

        // Drops every queued task without running it.
        void Clear();

    private:
        using Key = std::pair<int64_t, TaskId>; // due time, sequence

        bool RunNextDueBy(int64_t limit);
        int64_t After(int64_t delayMs) const;

        std::map<Key, Task> m_tasks;
        std::unordered_map<TaskId, int64_t> m_dueById;
        int64_t m_now = 0;
        TaskId m_nextId = 1;
    };

} // namespace WorkerHost
