#pragma once
#include <deque>
#include <stddef.h>
#include <stdint.h>
#include <string>

#include "farmlink/config.h"
#include "farmlink/farm_state.h"
#include "farmlink/notifier.h"

namespace farmlink
{

static constexpr size_t kEventLogCapacity = FARMLINK_CFG_EVENT_LOG_CAPACITY;

struct LogEntry
{
    uint32_t id;          // unique for the process lifetime
    uint64_t timestampMs; // wall-clock epoch ms at capture
    std::string time;     // local "HH:MM:SS"
    std::string message;
    Severity severity;
};

// User-facing event record, newest first, capped at kEventLogCapacity.
// Every record is mirrored to the diagnostic logger and, when permitted, notified once.
class EventLog
{
public:
    using WallClockFn = uint64_t (*)();

    // notifier may be null. wallClock defaults to the system clock.
    explicit EventLog(Notifier *notifier = nullptr, WallClockFn wallClock = nullptr);

    LogEntry record(const std::string &message, Severity severity);
    void clear();

    const std::deque<LogEntry> &entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    void setNotifier(Notifier *notifier) { notifier_ = notifier; }
    void setNotifyTitle(const std::string &title) { title_ = title; }
    uint32_t notificationsSent() const { return notificationsSent_; }

    static uint64_t systemWallClockMs();

private:
    std::deque<LogEntry> entries_;
    Notifier *notifier_;
    WallClockFn wallClock_;
    std::string title_ = FARMLINK_CFG_NOTIFY_TITLE;
    uint32_t nextId_ = 1;
    uint32_t notificationsSent_ = 0;
};

} // namespace farmlink
