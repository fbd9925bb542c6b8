#pragma once
#include <stddef.h>
#include <stdint.h>

namespace farmlink
{

// Closed actuator set of the controller. Values index ControlState and the catalog.
enum class Device : uint8_t
{
    FAN = 0,
    HEATER,
    LED,
    FEED,
    STEPPER1,
    STEPPER2
};

static constexpr size_t kDeviceCount = 6;

enum class DeviceKind : uint8_t
{
    PERSISTENT = 0, // toggled, remote value is sticky
    MOMENTARY = 1   // pulsed on, reverted after a fixed duration
};

struct DeviceInfo
{
    Device id;
    const char *key;   // wire name under /controls, e.g. "feed"
    const char *label; // upper-case display name used in events, e.g. "FEED"
    DeviceKind kind;
    uint32_t pulseMs; // 0 for persistent devices
};

static_assert(static_cast<uint8_t>(Device::STEPPER2) == kDeviceCount - 1, "Device values must be dense");

// Catalog entry for a device. Never null for a valid Device value.
const DeviceInfo &device_info(Device d);

// All devices in catalog order.
const DeviceInfo *device_catalog(size_t &count);

// Looks up a device by wire name (case-insensitive). Returns false for unknown names.
bool device_fromKey(const char *key, Device &out);

inline bool device_isMomentary(Device d)
{
    return device_info(d).kind == DeviceKind::MOMENTARY;
}

inline size_t device_index(Device d)
{
    return static_cast<size_t>(d);
}

} // namespace farmlink
