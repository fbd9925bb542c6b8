#include "farmlink/devices.h"

#include <strings.h>

#include "farmlink/config.h"

namespace farmlink
{

namespace
{
const DeviceInfo kCatalog[kDeviceCount] = {
    {Device::FAN, "fan", "FAN", DeviceKind::PERSISTENT, 0},
    {Device::HEATER, "heater", "HEATER", DeviceKind::PERSISTENT, 0},
    {Device::LED, "led", "LED", DeviceKind::PERSISTENT, 0},
    {Device::FEED, "feed", "FEED", DeviceKind::MOMENTARY, FARMLINK_CFG_FEED_PULSE_MS},
    {Device::STEPPER1, "stepper1", "STEPPER1", DeviceKind::MOMENTARY, FARMLINK_CFG_STEPPER_PULSE_MS},
    {Device::STEPPER2, "stepper2", "STEPPER2", DeviceKind::MOMENTARY, FARMLINK_CFG_STEPPER_PULSE_MS},
};
} // namespace

const DeviceInfo &device_info(Device d)
{
    return kCatalog[device_index(d)];
}

const DeviceInfo *device_catalog(size_t &count)
{
    count = kDeviceCount;
    return kCatalog;
}

bool device_fromKey(const char *key, Device &out)
{
    if (!key || key[0] == '\0')
    {
        return false;
    }
    for (size_t i = 0; i < kDeviceCount; ++i)
    {
        if (strcasecmp(kCatalog[i].key, key) == 0)
        {
            out = kCatalog[i].id;
            return true;
        }
    }
    return false;
}

} // namespace farmlink
