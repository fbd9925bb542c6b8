#pragma once
#include <array>
#include <stddef.h>
#include <stdint.h>

#include "farmlink/devices.h"

namespace farmlink
{

// Store keys of the three mirrored records.
static constexpr const char *kSensorsPath = "sensors";
static constexpr const char *kControlsPath = "controls";
static constexpr const char *kSchedulePath = "schedule";

// --- C++ enums (stronger than magic ints/strings) ---
enum class Severity : uint8_t
{
    INFO = 0,
    SUCCESS = 1,
    ERROR = 2
};

enum class SessionPhase : uint8_t
{
    BOOTSTRAPPING = 0,
    AUTHENTICATING = 1,
    ACTIVE = 2,
    TERMINATED = 3
};

enum class FeedStatus : uint8_t
{
    LOW = 0,
    MID = 1,
    FULL = 2
};

enum class AmmoniaStatus : uint8_t
{
    SAFE = 0,
    HIGH = 1
};

static_assert(static_cast<uint8_t>(Severity::ERROR) == 2, "Severity values must be stable");
static_assert(static_cast<uint8_t>(SessionPhase::TERMINATED) == 3, "SessionPhase values must be stable");

// --- Sensors ---
struct SensorSnapshot
{
    float temperature = 0.0f; // deg C
    float humidity = 0.0f;    // %
    float ammonia = 0.0f;     // ppm
    int feedLevel = 0;        // 0..100
};

// --- Controls ---
struct ControlState
{
    std::array<bool, kDeviceCount> energized{};

    bool get(Device d) const { return energized[device_index(d)]; }
    void set(Device d, bool on) { energized[device_index(d)] = on; }
};

inline bool operator==(const ControlState &a, const ControlState &b)
{
    return a.energized == b.energized;
}

// --- Schedule ---
struct TimeOfDay
{
    uint8_t hour = 0;   // 0..23
    uint8_t minute = 0; // 0..59

    bool valid() const { return hour < 24 && minute < 60; }
    uint16_t minutesSinceMidnight() const { return static_cast<uint16_t>(hour * 60u + minute); }
};

inline bool operator==(const TimeOfDay &a, const TimeOfDay &b)
{
    return a.hour == b.hour && a.minute == b.minute;
}

inline bool operator!=(const TimeOfDay &a, const TimeOfDay &b)
{
    return !(a == b);
}

enum class ScheduleField : uint8_t
{
    EGG_TIME = 0,
    STOOL_TIME,
    FEED_TIME,
    LED_ON,
    LED_OFF
};

static constexpr size_t kScheduleFieldCount = 5;
static_assert(static_cast<uint8_t>(ScheduleField::LED_OFF) == kScheduleFieldCount - 1, "ScheduleField values must be dense");

// No ordering between fields: led_on after led_off is an overnight-off period.
struct Schedule
{
    std::array<TimeOfDay, kScheduleFieldCount> times{};

    const TimeOfDay &get(ScheduleField f) const { return times[static_cast<size_t>(f)]; }
    void set(ScheduleField f, const TimeOfDay &t) { times[static_cast<size_t>(f)] = t; }
};

inline bool operator==(const Schedule &a, const Schedule &b)
{
    return a.times == b.times;
}

inline bool operator!=(const Schedule &a, const Schedule &b)
{
    return !(a == b);
}

// Record used until the store delivers one.
Schedule schedule_defaults();

} // namespace farmlink
