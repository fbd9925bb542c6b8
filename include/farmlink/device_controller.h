#pragma once
#include <array>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "farmlink/event_log.h"
#include "farmlink/farm_state.h"
#include "farmlink/remote_channel.h"
#include "farmlink/task_scheduler.h"

namespace farmlink
{

// Actuator commands against the store.
//  - Persistent devices are toggled relative to the last value the store reported.
//  - Momentary devices are pulsed on and reverted by a timer after their fixed duration.
// Local state only ever changes through onRemoteUpdate(); commands request writes.
// Contract: channel, events and scheduler outlive the controller and are drained before it;
// write callbacks and revert tasks capture the controller.
class DeviceController
{
public:
    DeviceController(RemoteStateChannel &channel, EventLog &events, TaskScheduler &scheduler);

    // Authoritative replace. Pending reverts are left alone.
    void onRemoteUpdate(const ControlState &state);

    // Returns false without writing when the device is not persistent.
    bool toggle(Device device);

    // Returns false without writing when the device is not momentary.
    bool pulse(Device device);

    bool lastKnown(Device device) const { return lastKnown_.get(device); }
    const ControlState &lastKnownState() const { return lastKnown_; }

    size_t pendingReverts(Device device) const { return reverts_[device_index(device)].size(); }
    size_t pendingRevertsTotal() const;

    // Shutdown path: issues every scheduled revert now instead of waiting for its timer.
    // Pulses confirmed after a flush revert at once, so nothing is left to the scheduler.
    size_t flushPendingReverts();

    size_t activationsInFlight() const { return activationsInFlight_; }

private:
    void scheduleRevert(Device device);
    void issueRevert(Device device, TaskId id);
    static std::string controlPath(Device device);

    RemoteStateChannel &channel_;
    EventLog &events_;
    TaskScheduler &scheduler_;
    ControlState lastKnown_;
    std::array<std::vector<TaskId>, kDeviceCount> reverts_;
    size_t activationsInFlight_ = 0;
    bool revertImmediately_ = false;
};

} // namespace farmlink
