#include "farmlink/simulation.h"

#include <ArduinoJson.h>

#include "farmlink/logger.h"
#include "farmlink/state_json.h"

namespace farmlink
{

// Per-step climate deltas.
static constexpr float kAmbientTempC = 24.0f;
static constexpr float kHeaterTempStep = 0.6f;
static constexpr float kFanTempStep = 0.4f;
static constexpr float kTempRelax = 0.1f; // fraction of the gap to ambient closed each step
static constexpr float kAmbientHumidity = 60.0f;
static constexpr float kFanHumidityStep = 1.5f;
static constexpr float kHumidityRelax = 0.05f;
static constexpr float kAmmoniaBuildup = 0.5f;
static constexpr float kFanAmmoniaStep = 1.2f;
static constexpr float kStepperAmmoniaStep = 4.0f;
static constexpr int kFeedDispenseStep = 4;
static constexpr int kFeedRefillLevel = 100;

static float clampf(float v, float lo, float hi)
{
    return v < lo ? lo : (v > hi ? hi : v);
}

ControllerSimulator::ControllerSimulator(MemoryStore &store, const Clock &clock, SimMode mode, uint32_t intervalMs)
    : store_(store), clock_(clock), mode_(mode), intervalMs_(intervalMs)
{
    climate_.temperature = kAmbientTempC;
    climate_.humidity = kAmbientHumidity;
    climate_.ammonia = 5.0f;
    climate_.feedLevel = 80;
}

bool ControllerSimulator::begin()
{
    if (!memoryStore_seedDefaults(store_))
    {
        FARMLINK_LOG_ERROR(LogDomain::SIM, "could not seed controls/schedule");
        return false;
    }

    started_ = true;
    lastPublishMs_ = clock_.nowMs();
    FARMLINK_LOG_INFO(LogDomain::SIM, "controller simulator started (mode=%s, every %lu ms)", simMode_name(mode_),
                      (unsigned long)intervalMs_);
    if (mode_ != SimMode::SILENT && !publish())
    {
        FARMLINK_LOG_WARN(LogDomain::SIM, "first sensor snapshot not published");
    }
    return true;
}

void ControllerSimulator::setMode(SimMode mode)
{
    if (mode_ == mode)
    {
        return;
    }
    mode_ = mode;
    FARMLINK_LOG_INFO(LogDomain::SIM, "simulation mode -> %s", simMode_name(mode));
}

bool ControllerSimulator::tick()
{
    if (!started_)
    {
        return false;
    }
    const uint64_t now = clock_.nowMs();
    if (now - lastPublishMs_ < intervalMs_)
    {
        return false;
    }
    lastPublishMs_ = now;
    return publishNow();
}

bool ControllerSimulator::publishNow()
{
    step(readControls());
    return publish();
}

ControlState ControllerSimulator::readControls() const
{
    ControlState controls;
    std::string json;
    if (store_.read(kControlsPath, json))
    {
        const StateJsonError err = decodeControls(json, controls);
        if (err != StateJsonError::OK)
        {
            FARMLINK_LOG_WARN_EVERY("sim_controls", 10000, LogDomain::SIM, "controls unreadable (%s), assuming off",
                                    stateJsonErrorName(err));
        }
    }
    return controls;
}

void ControllerSimulator::step(const ControlState &controls)
{
    float temp = climate_.temperature + (kAmbientTempC - climate_.temperature) * kTempRelax;
    if (controls.get(Device::HEATER))
        temp += kHeaterTempStep;
    if (controls.get(Device::FAN))
        temp -= kFanTempStep;
    climate_.temperature = clampf(temp, -10.0f, 50.0f);

    float humidity = climate_.humidity + (kAmbientHumidity - climate_.humidity) * kHumidityRelax;
    if (controls.get(Device::FAN))
        humidity -= kFanHumidityStep;
    climate_.humidity = clampf(humidity, 0.0f, 100.0f);

    float ammonia = climate_.ammonia + kAmmoniaBuildup;
    if (controls.get(Device::FAN))
        ammonia -= kFanAmmoniaStep;
    if (controls.get(Device::STEPPER1) || controls.get(Device::STEPPER2))
        ammonia -= kStepperAmmoniaStep;
    climate_.ammonia = clampf(ammonia, 0.0f, 100.0f);

    if (controls.get(Device::FEED))
    {
        climate_.feedLevel -= kFeedDispenseStep;
        if (climate_.feedLevel <= 0)
        {
            climate_.feedLevel = kFeedRefillLevel;
            FARMLINK_LOG_INFO(LogDomain::SIM, "feed hopper refilled");
        }
    }
}

bool ControllerSimulator::publish()
{
    switch (mode_)
    {
    case SimMode::SILENT:
        FARMLINK_LOG_DEBUG_EVERY("sim_silent", 10000, LogDomain::SIM, "silent mode, snapshot withheld");
        return false;
    case SimMode::MALFORMED:
    {
        StaticJsonDocument<JSON_OBJECT_SIZE(4)> doc;
        doc["temperature"] = climate_.temperature;
        doc["humidity"] = climate_.humidity;
        doc["feedLevel"] = climate_.feedLevel;
        std::string json;
        if (serializeJson(doc, json) == 0 || !store_.put(kSensorsPath, json))
        {
            return false;
        }
        ++published_;
        return true;
    }
    case SimMode::NORMAL:
    default:
    {
        std::string json;
        const StateJsonError err = encodeSensors(climate_, json);
        if (err != StateJsonError::OK)
        {
            FARMLINK_LOG_ERROR(LogDomain::SIM, "sensor encode failed: %s", stateJsonErrorName(err));
            return false;
        }
        if (!store_.put(kSensorsPath, json))
        {
            return false;
        }
        ++published_;
        return true;
    }
    }
}

} // namespace farmlink
