#pragma once
#include <stdint.h>

#include "farmlink/event_log.h"
#include "farmlink/farm_state.h"
#include "farmlink/remote_channel.h"

namespace farmlink
{

// Editable copy of the automation schedule. The draft is only persisted by save(),
// which writes the whole record in one request.
// Contract: channel and events outlive the manager.
class ScheduleManager
{
public:
    ScheduleManager(RemoteStateChannel &channel, EventLog &events);

    // Authoritative replace: unsaved edits are discarded.
    void onRemoteUpdate(const Schedule &schedule);

    // Invalid times return false and leave the draft unchanged.
    bool setField(ScheduleField field, const TimeOfDay &value);
    bool setField(ScheduleField field, const char *hhmm);

    // Returns false when the draft could not be encoded (nothing is written).
    bool save();

    const Schedule &draft() const { return draft_; }
    bool isDirty() const { return editRevision_ != savedRevision_; }
    uint32_t savesInFlight() const { return savesInFlight_; }

private:
    RemoteStateChannel &channel_;
    EventLog &events_;
    Schedule draft_;
    uint32_t editRevision_ = 0;
    uint32_t savedRevision_ = 0;
    uint32_t savesInFlight_ = 0;
};

} // namespace farmlink
