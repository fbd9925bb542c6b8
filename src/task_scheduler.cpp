#include "farmlink/task_scheduler.h"

#include <chrono>
#include <cstddef>

#include "farmlink/logger.h"

namespace farmlink
{

uint64_t SteadyClock::nowMs() const
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

TaskId TaskScheduler::scheduleAfter(uint32_t delayMs, const char *label, std::function<void()> fn)
{
    const TaskId id = nextId_++;
    if (nextId_ == kInvalidTaskId)
    {
        nextId_ = 1;
    }
    tasks_.push_back(Task{id, clock_.nowMs() + delayMs, nextSeq_++, label ? label : "task", std::move(fn)});
    FARMLINK_LOG_DEBUG_EVERY("task_sched", 1000, LogDomain::SYSTEM, "scheduled %s #%u in %lu ms (%u pending)",
                             tasks_.back().label, (unsigned)id, (unsigned long)delayMs, (unsigned)tasks_.size());
    return id;
}

bool TaskScheduler::cancel(TaskId id)
{
    for (auto it = tasks_.begin(); it != tasks_.end(); ++it)
    {
        if (it->id == id)
        {
            tasks_.erase(it);
            return true;
        }
    }
    return false;
}

bool TaskScheduler::isPending(TaskId id) const
{
    for (const Task &t : tasks_)
    {
        if (t.id == id)
        {
            return true;
        }
    }
    return false;
}

bool TaskScheduler::popDue(uint64_t now, Task &out)
{
    size_t best = tasks_.size();
    for (size_t i = 0; i < tasks_.size(); ++i)
    {
        const Task &t = tasks_[i];
        if (t.dueMs > now)
        {
            continue;
        }
        if (best == tasks_.size() || t.dueMs < tasks_[best].dueMs ||
            (t.dueMs == tasks_[best].dueMs && t.seq < tasks_[best].seq))
        {
            best = i;
        }
    }
    if (best == tasks_.size())
    {
        return false;
    }
    out = std::move(tasks_[best]);
    tasks_.erase(tasks_.begin() + static_cast<std::ptrdiff_t>(best));
    return true;
}

size_t TaskScheduler::runDue()
{
    const uint64_t now = clock_.nowMs();
    size_t ran = 0;
    Task task;
    // A task scheduled from inside fn with zero delay runs in this same pass.
    while (popDue(now, task))
    {
        if (task.fn)
        {
            task.fn();
        }
        ++ran;
    }
    return ran;
}

bool TaskScheduler::nextDueMs(uint64_t &dueMs) const
{
    if (tasks_.empty())
    {
        return false;
    }
    dueMs = tasks_.front().dueMs;
    for (const Task &t : tasks_)
    {
        if (t.dueMs < dueMs)
        {
            dueMs = t.dueMs;
        }
    }
    return true;
}

} // namespace farmlink
