#include "farmlink/event_log.h"

#include <chrono>

#include "farmlink/domain_strings.h"
#include "farmlink/logger.h"
#include "farmlink/time_format.h"

namespace farmlink
{

static LogLevel levelFor(Severity severity)
{
    return severity == Severity::ERROR ? LogLevel::ERROR : LogLevel::INFO;
}

uint64_t EventLog::systemWallClockMs()
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count());
}

EventLog::EventLog(Notifier *notifier, WallClockFn wallClock)
    : notifier_(notifier), wallClock_(wallClock ? wallClock : &EventLog::systemWallClockMs)
{
}

LogEntry EventLog::record(const std::string &message, Severity severity)
{
    LogEntry entry;
    entry.id = nextId_++;
    entry.timestampMs = wallClock_();
    char timeBuf[12];
    time_format::formatLocalClock(entry.timestampMs, timeBuf, sizeof(timeBuf));
    entry.time = timeBuf;
    entry.message = message;
    entry.severity = severity;

    entries_.push_front(entry);
    while (entries_.size() > kEventLogCapacity)
    {
        entries_.pop_back();
    }

    logger_log(levelFor(severity), LogDomain::EVENTS, "[%s] %s", toString(severity), message.c_str());

    if (notifier_ && notifier_->isPermissionGranted())
    {
        notifier_->notify(title_.c_str(), message.c_str());
        ++notificationsSent_;
    }

    return entry;
}

void EventLog::clear()
{
    if (entries_.empty())
    {
        return;
    }
    FARMLINK_LOG_DEBUG(LogDomain::EVENTS, "cleared %u entries", (unsigned)entries_.size());
    entries_.clear();
}

} // namespace farmlink
