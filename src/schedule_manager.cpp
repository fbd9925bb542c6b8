#include "farmlink/schedule_manager.h"

#include <stdio.h>

#include "farmlink/domain_strings.h"
#include "farmlink/logger.h"
#include "farmlink/state_json.h"
#include "farmlink/time_format.h"

namespace farmlink
{

ScheduleManager::ScheduleManager(RemoteStateChannel &channel, EventLog &events)
    : channel_(channel), events_(events), draft_(schedule_defaults())
{
}

void ScheduleManager::onRemoteUpdate(const Schedule &schedule)
{
    if (isDirty() && schedule != draft_)
    {
        FARMLINK_LOG_INFO(LogDomain::SCHEDULE, "remote schedule replaced unsaved edits");
    }
    draft_ = schedule;
    savedRevision_ = editRevision_;
}

bool ScheduleManager::setField(ScheduleField field, const TimeOfDay &value)
{
    if (!value.valid())
    {
        FARMLINK_LOG_WARN(LogDomain::SCHEDULE, "rejected %s: %u:%u out of range", toString(field),
                          (unsigned)value.hour, (unsigned)value.minute);
        return false;
    }
    draft_.set(field, value);
    ++editRevision_;
    return true;
}

bool ScheduleManager::setField(ScheduleField field, const char *hhmm)
{
    TimeOfDay parsed;
    if (!time_format::parseTimeOfDay(hhmm, parsed))
    {
        FARMLINK_LOG_WARN(LogDomain::SCHEDULE, "rejected %s: '%s' is not HH:MM", toString(field), hhmm ? hhmm : "");
        return false;
    }
    return setField(field, parsed);
}

bool ScheduleManager::save()
{
    std::string json;
    const StateJsonError err = encodeSchedule(draft_, json);
    if (err != StateJsonError::OK)
    {
        FARMLINK_LOG_ERROR(LogDomain::SCHEDULE, "encode failed: %s", stateJsonErrorName(err));
        return false;
    }

    const uint32_t revision = editRevision_;
    ++savesInFlight_;
    channel_.write(kSchedulePath, json, [this, revision](const WriteOutcome &outcome)
                   {
        --savesInFlight_;
        if (!outcome.ok)
        {
            char msg[128];
            snprintf(msg, sizeof(msg), "Failed to save schedule: %s", outcome.reason.c_str());
            events_.record(msg, Severity::ERROR);
            return;
        }
        // Edits made while the write was in flight keep the draft dirty.
        if (revision == editRevision_)
        {
            savedRevision_ = revision;
        }
        events_.record("Schedule updated successfully", Severity::SUCCESS); });
    FARMLINK_LOG_DEBUG(LogDomain::SCHEDULE, "save requested: %s", json.c_str());
    return true;
}

} // namespace farmlink
