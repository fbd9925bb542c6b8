#include "farmlink/device_controller.h"

#include <algorithm>
#include <memory>
#include <stdio.h>

#include "farmlink/logger.h"
#include "farmlink/state_json.h"

namespace farmlink
{

DeviceController::DeviceController(RemoteStateChannel &channel, EventLog &events, TaskScheduler &scheduler)
    : channel_(channel), events_(events), scheduler_(scheduler)
{
}

std::string DeviceController::controlPath(Device device)
{
    std::string path(kControlsPath);
    path += '/';
    path += device_info(device).key;
    return path;
}

void DeviceController::onRemoteUpdate(const ControlState &state)
{
    if (state == lastKnown_)
    {
        return;
    }
    lastKnown_ = state;
    FARMLINK_LOG_DEBUG(LogDomain::DEVICE, "controls fan=%d heater=%d led=%d feed=%d stepper1=%d stepper2=%d",
                       state.get(Device::FAN), state.get(Device::HEATER), state.get(Device::LED),
                       state.get(Device::FEED), state.get(Device::STEPPER1), state.get(Device::STEPPER2));
}

bool DeviceController::toggle(Device device)
{
    const DeviceInfo &info = device_info(device);
    if (info.kind != DeviceKind::PERSISTENT)
    {
        FARMLINK_LOG_WARN(LogDomain::DEVICE, "toggle rejected: %s is momentary", info.key);
        return false;
    }

    const bool next = !lastKnown_.get(device);
    EventLog &events = events_;
    channel_.write(controlPath(device), encodeBool(next), [&events, &info, next](const WriteOutcome &outcome)
                   {
        char msg[128];
        if (outcome.ok)
        {
            snprintf(msg, sizeof(msg), "%s turned %s", info.label, next ? "ON" : "OFF");
            events.record(msg, Severity::INFO);
        }
        else
        {
            snprintf(msg, sizeof(msg), "Failed to toggle %s: %s", info.key, outcome.reason.c_str());
            events.record(msg, Severity::ERROR);
        } });
    return true;
}

bool DeviceController::pulse(Device device)
{
    const DeviceInfo &info = device_info(device);
    if (info.kind != DeviceKind::MOMENTARY)
    {
        FARMLINK_LOG_WARN(LogDomain::DEVICE, "pulse rejected: %s is not momentary", info.key);
        return false;
    }

    ++activationsInFlight_;
    channel_.write(controlPath(device), encodeBool(true), [this, device, &info](const WriteOutcome &outcome)
                   {
        --activationsInFlight_;
        char msg[128];
        if (!outcome.ok)
        {
            snprintf(msg, sizeof(msg), "Failed to trigger %s: %s", info.key, outcome.reason.c_str());
            events_.record(msg, Severity::ERROR);
            return;
        }
        snprintf(msg, sizeof(msg), "Activated %s", info.label);
        events_.record(msg, Severity::SUCCESS);
        if (revertImmediately_)
        {
            issueRevert(device, kInvalidTaskId);
            return;
        }
        scheduleRevert(device); });
    return true;
}

void DeviceController::scheduleRevert(Device device)
{
    const uint32_t durationMs = device_info(device).pulseMs;
    std::vector<TaskId> &pending = reverts_[device_index(device)];
    // Task reads its own id through the slot.
    std::shared_ptr<TaskId> slot = std::make_shared<TaskId>(kInvalidTaskId);
    const TaskId id = scheduler_.scheduleAfter(durationMs, "revert", [this, device, slot]()
                                               { issueRevert(device, *slot); });
    *slot = id;
    pending.push_back(id);
    FARMLINK_LOG_DEBUG(LogDomain::DEVICE, "%s revert in %lu ms (%u pending)", device_info(device).key,
                       (unsigned long)durationMs, (unsigned)pending.size());
}

void DeviceController::issueRevert(Device device, TaskId id)
{
    std::vector<TaskId> &pending = reverts_[device_index(device)];
    pending.erase(std::remove(pending.begin(), pending.end(), id), pending.end());

    const char *key = device_info(device).key;
    channel_.write(controlPath(device), encodeBool(false), [key](const WriteOutcome &outcome)
                   {
        if (outcome.ok)
        {
            FARMLINK_LOG_DEBUG(LogDomain::DEVICE, "%s reverted", key);
        }
        else
        {
            FARMLINK_LOG_WARN(LogDomain::DEVICE, "%s revert failed: %s", key, outcome.reason.c_str());
        } });
}

size_t DeviceController::pendingRevertsTotal() const
{
    size_t total = 0;
    for (const std::vector<TaskId> &pending : reverts_)
    {
        total += pending.size();
    }
    return total;
}

size_t DeviceController::flushPendingReverts()
{
    revertImmediately_ = true;
    size_t flushed = 0;
    for (size_t i = 0; i < kDeviceCount; ++i)
    {
        const Device device = static_cast<Device>(i);
        const std::vector<TaskId> pending = reverts_[i];
        for (const TaskId id : pending)
        {
            if (scheduler_.cancel(id))
            {
                issueRevert(device, id);
                ++flushed;
            }
        }
    }
    if (flushed > 0)
    {
        FARMLINK_LOG_INFO(LogDomain::DEVICE, "flushed %u pending revert(s)", (unsigned)flushed);
    }
    if (activationsInFlight_ > 0)
    {
        FARMLINK_LOG_INFO(LogDomain::DEVICE, "%u activation(s) in flight revert on confirmation",
                          (unsigned)activationsInFlight_);
    }
    return flushed;
}

} // namespace farmlink
