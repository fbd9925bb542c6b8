#pragma once
#include <memory>
#include <stddef.h>
#include <stdint.h>

#include "farmlink/auth.h"
#include "farmlink/device_controller.h"
#include "farmlink/event_log.h"
#include "farmlink/farm_state.h"
#include "farmlink/remote_channel.h"
#include "farmlink/schedule_manager.h"

namespace farmlink
{

// Owns the live mirrors of /sensors, /controls and /schedule and ties their
// subscriptions to the auth lifecycle:
//   BOOTSTRAPPING -> (no session) AUTHENTICATING -> ACTIVE -> TERMINATED
// Snapshots are drained by poll(), the only code path that mutates the mirrors.
// Contract: every collaborator outlives the session.
class SyncSession
{
public:
    SyncSession(RemoteStateChannel &channel, AuthProvider &auth, EventLog &events, DeviceController &devices,
                ScheduleManager &schedule);
    ~SyncSession();

    SyncSession(const SyncSession &) = delete;
    SyncSession &operator=(const SyncSession &) = delete;

    // Registers the auth listener. Only valid once, while BOOTSTRAPPING.
    bool begin();

    // Drains pending snapshots in the order sensors, controls, schedule. Returns snapshots applied.
    size_t poll();

    // Releases each stream exactly once and detaches from auth. Idempotent.
    void terminate();

    // Manual sign-in retry. Only valid while AUTHENTICATING with no attempt in flight.
    bool signIn();

    SessionPhase phase() const { return phase_; }
    bool isActive() const { return phase_ == SessionPhase::ACTIVE; }

    const SensorSnapshot &sensors() const { return sensors_; }
    const ControlState &controls() const { return controls_; }
    const Schedule &schedule() const { return schedule_; }
    const Schedule &scheduleDraft() const { return scheduleManager_.draft(); }
    bool scheduleDirty() const { return scheduleManager_.isDirty(); }
    const EventLog &events() const { return events_; }

    // Commands. Device and schedule commands return false unless ACTIVE.
    bool toggle(Device device);
    bool pulse(Device device);
    bool setScheduleField(ScheduleField field, const TimeOfDay &value);
    bool setScheduleField(ScheduleField field, const char *hhmm);
    bool saveSchedule();
    void clearLog();

    uint32_t rejectedPayloads() const { return rejectedPayloads_; }
    uint32_t snapshotsApplied() const { return snapshotsApplied_; }

private:
    void handleAuthChange(bool hasSession);
    void requestSignIn();
    void openStreams();
    void releaseStreams();
    bool requireActive(const char *command) const;
    void rejectPayload(const char *path, const char *reason);

    RemoteStateChannel &channel_;
    AuthProvider &auth_;
    EventLog &events_;
    DeviceController &devices_;
    ScheduleManager &scheduleManager_;

    SessionPhase phase_ = SessionPhase::BOOTSTRAPPING;
    AuthListenerId authListener_ = kInvalidAuthListener;
    bool begun_ = false;
    bool signInInFlight_ = false;

    SnapshotStreamPtr sensorsStream_;
    SnapshotStreamPtr controlsStream_;
    SnapshotStreamPtr scheduleStream_;

    SensorSnapshot sensors_;
    ControlState controls_;
    Schedule schedule_;

    uint32_t rejectedPayloads_ = 0;
    uint32_t snapshotsApplied_ = 0;

    // Expires with the session so late auth callbacks become no-ops.
    std::shared_ptr<SyncSession *> alive_;
};

} // namespace farmlink
