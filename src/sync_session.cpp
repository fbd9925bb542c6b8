#include "farmlink/sync_session.h"

#include <stdio.h>

#include "farmlink/domain_strings.h"
#include "farmlink/logger.h"
#include "farmlink/state_json.h"

namespace farmlink
{

static constexpr uint32_t kRejectLogIntervalMs = 5000;

SyncSession::SyncSession(RemoteStateChannel &channel, AuthProvider &auth, EventLog &events, DeviceController &devices,
                         ScheduleManager &schedule)
    : channel_(channel), auth_(auth), events_(events), devices_(devices), scheduleManager_(schedule),
      schedule_(schedule_defaults()), alive_(std::make_shared<SyncSession *>(this))
{
}

SyncSession::~SyncSession()
{
    terminate();
}

bool SyncSession::begin()
{
    if (begun_ || phase_ != SessionPhase::BOOTSTRAPPING)
    {
        FARMLINK_LOG_WARN(LogDomain::SYSTEM, "begin ignored in phase %s", toString(phase_));
        return false;
    }
    begun_ = true;

    std::weak_ptr<SyncSession *> weak = alive_;
    authListener_ = auth_.onAuthChange([weak](bool hasSession)
                                       {
        std::shared_ptr<SyncSession *> self = weak.lock();
        if (self)
        {
            (*self)->handleAuthChange(hasSession);
        } });
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "session bootstrapping");
    return true;
}

void SyncSession::handleAuthChange(bool hasSession)
{
    switch (phase_)
    {
    case SessionPhase::BOOTSTRAPPING:
    case SessionPhase::AUTHENTICATING:
        if (hasSession)
        {
            openStreams();
            phase_ = SessionPhase::ACTIVE;
            events_.record("User authenticated successfully", Severity::SUCCESS);
            return;
        }
        phase_ = SessionPhase::AUTHENTICATING;
        requestSignIn();
        return;
    case SessionPhase::ACTIVE:
        if (!hasSession)
        {
            FARMLINK_LOG_WARN(LogDomain::AUTH, "session lost while active; keeping subscriptions");
        }
        return;
    case SessionPhase::TERMINATED:
        return;
    }
}

void SyncSession::requestSignIn()
{
    if (signInInFlight_)
    {
        return;
    }
    signInInFlight_ = true;
    FARMLINK_LOG_INFO(LogDomain::AUTH, "signing in anonymously");

    std::weak_ptr<SyncSession *> weak = alive_;
    auth_.signInAnonymously([weak](const AuthOutcome &outcome)
                            {
        std::shared_ptr<SyncSession *> self = weak.lock();
        if (!self)
        {
            return;
        }
        SyncSession &session = **self;
        session.signInInFlight_ = false;
        if (session.phase_ == SessionPhase::TERMINATED)
        {
            return;
        }
        if (!outcome.ok)
        {
            char msg[128];
            snprintf(msg, sizeof(msg), "Auth error: %s", outcome.reason.c_str());
            session.events_.record(msg, Severity::ERROR);
        } });
}

bool SyncSession::signIn()
{
    if (phase_ != SessionPhase::AUTHENTICATING || signInInFlight_)
    {
        FARMLINK_LOG_WARN(LogDomain::AUTH, "sign-in not possible in phase %s%s", toString(phase_),
                          signInInFlight_ ? " (attempt in flight)" : "");
        return false;
    }
    requestSignIn();
    return true;
}

void SyncSession::openStreams()
{
    sensorsStream_ = channel_.subscribe(kSensorsPath);
    controlsStream_ = channel_.subscribe(kControlsPath);
    scheduleStream_ = channel_.subscribe(kSchedulePath);
    FARMLINK_LOG_INFO(LogDomain::STORE, "subscribed to %s, %s, %s", kSensorsPath, kControlsPath, kSchedulePath);
}

void SyncSession::releaseStreams()
{
    SnapshotStreamPtr *streams[] = {&sensorsStream_, &controlsStream_, &scheduleStream_};
    for (SnapshotStreamPtr *stream : streams)
    {
        if (*stream)
        {
            channel_.unsubscribe(*stream);
            stream->reset();
        }
    }
}

void SyncSession::terminate()
{
    if (phase_ == SessionPhase::TERMINATED)
    {
        return;
    }
    const SessionPhase from = phase_;
    phase_ = SessionPhase::TERMINATED;

    releaseStreams();
    if (authListener_ != kInvalidAuthListener)
    {
        auth_.removeAuthListener(authListener_);
        authListener_ = kInvalidAuthListener;
    }
    alive_.reset();
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "session terminated (was %s)", toString(from));
}

void SyncSession::rejectPayload(const char *path, const char *reason)
{
    ++rejectedPayloads_;
    FARMLINK_LOG_WARN_EVERY("sync_reject", kRejectLogIntervalMs, LogDomain::STORE,
                            "ignored %s snapshot: %s (%u rejected so far)", path, reason,
                            (unsigned)rejectedPayloads_);
}

size_t SyncSession::poll()
{
    if (phase_ != SessionPhase::ACTIVE)
    {
        return 0;
    }

    size_t applied = 0;
    std::string payload;

    if (sensorsStream_ && sensorsStream_->next(payload))
    {
        SensorSnapshot next;
        const StateJsonError err = decodeSensors(payload, next);
        if (err == StateJsonError::OK)
        {
            sensors_ = next;
            ++applied;
            FARMLINK_LOG_DEBUG_EVERY("sync_sensors", 10000, LogDomain::STORE, "sensors t=%.1f h=%.1f nh3=%.1f feed=%d",
                                     next.temperature, next.humidity, next.ammonia, next.feedLevel);
        }
        else
        {
            rejectPayload(kSensorsPath, stateJsonErrorName(err));
        }
    }

    if (controlsStream_ && controlsStream_->next(payload))
    {
        ControlState next;
        const StateJsonError err = decodeControls(payload, next);
        if (err == StateJsonError::OK)
        {
            controls_ = next;
            devices_.onRemoteUpdate(controls_);
            ++applied;
        }
        else
        {
            rejectPayload(kControlsPath, stateJsonErrorName(err));
        }
    }

    if (scheduleStream_ && scheduleStream_->next(payload))
    {
        Schedule next;
        const StateJsonError err = decodeSchedule(payload, next);
        if (err == StateJsonError::OK)
        {
            schedule_ = next;
            scheduleManager_.onRemoteUpdate(schedule_);
            ++applied;
        }
        else
        {
            rejectPayload(kSchedulePath, stateJsonErrorName(err));
        }
    }

    snapshotsApplied_ += static_cast<uint32_t>(applied);
    return applied;
}

bool SyncSession::requireActive(const char *command) const
{
    if (phase_ == SessionPhase::ACTIVE)
    {
        return true;
    }
    FARMLINK_LOG_WARN(LogDomain::SYSTEM, "%s refused: session is %s", command, toString(phase_));
    return false;
}

bool SyncSession::toggle(Device device)
{
    return requireActive("toggle") && devices_.toggle(device);
}

bool SyncSession::pulse(Device device)
{
    return requireActive("pulse") && devices_.pulse(device);
}

bool SyncSession::setScheduleField(ScheduleField field, const TimeOfDay &value)
{
    return requireActive("set") && scheduleManager_.setField(field, value);
}

bool SyncSession::setScheduleField(ScheduleField field, const char *hhmm)
{
    return requireActive("set") && scheduleManager_.setField(field, hhmm);
}

bool SyncSession::saveSchedule()
{
    return requireActive("save") && scheduleManager_.save();
}

void SyncSession::clearLog()
{
    events_.clear();
}

} // namespace farmlink
