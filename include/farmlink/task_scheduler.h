#pragma once
#include <functional>
#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace farmlink
{

// Monotonic millisecond source. Wall-clock changes never move it.
class Clock
{
public:
    virtual ~Clock() = default;
    virtual uint64_t nowMs() const = 0;
};

class SteadyClock : public Clock
{
public:
    uint64_t nowMs() const override;
};

using TaskId = uint32_t;
static constexpr TaskId kInvalidTaskId = 0;

// Cooperative deferred tasks for the loop thread. Nothing runs until runDue()/flush() is called.
class TaskScheduler
{
public:
    explicit TaskScheduler(const Clock &clock) : clock_(clock) {}

    // label must outlive the task (string literal).
    TaskId scheduleAfter(uint32_t delayMs, const char *label, std::function<void()> fn);
    bool cancel(TaskId id);
    bool isPending(TaskId id) const;

    // Runs every task whose due time has passed, earliest first (ties in scheduling order).
    size_t runDue();

    size_t pendingCount() const { return tasks_.size(); }
    bool nextDueMs(uint64_t &dueMs) const;
    uint64_t nowMs() const { return clock_.nowMs(); }

private:
    struct Task
    {
        TaskId id;
        uint64_t dueMs;
        uint64_t seq;
        const char *label;
        std::function<void()> fn;
    };

    bool popDue(uint64_t now, Task &out);

    const Clock &clock_;
    std::vector<Task> tasks_;
    TaskId nextId_ = 1;
    uint64_t nextSeq_ = 0;
};

} // namespace farmlink
