#pragma once
#include <stdint.h>

#include "farmlink/app_config.h"
#include "farmlink/farm_state.h"
#include "farmlink/memory_store.h"
#include "farmlink/task_scheduler.h"

namespace farmlink
{

// Stand-in for the controller firmware: publishes /sensors on an interval and lets the
// climate drift with the actuator states it reads back from /controls.
class ControllerSimulator
{
public:
    ControllerSimulator(MemoryStore &store, const Clock &clock, SimMode mode,
                        uint32_t intervalMs = FARMLINK_CFG_SIM_SENSOR_MS);

    // Seeds /controls and /schedule when absent and publishes a first snapshot.
    bool begin();

    // Publishes when the interval elapsed. Returns true when a snapshot was written.
    bool tick();

    // Advances the climate model one step and publishes regardless of the interval.
    bool publishNow();

    void setMode(SimMode mode);
    SimMode mode() const { return mode_; }
    const SensorSnapshot &climate() const { return climate_; }
    uint32_t published() const { return published_; }

private:
    void step(const ControlState &controls);
    ControlState readControls() const;
    bool publish();

    MemoryStore &store_;
    const Clock &clock_;
    SimMode mode_;
    uint32_t intervalMs_;
    uint64_t lastPublishMs_ = 0;
    bool started_ = false;
    SensorSnapshot climate_;
    uint32_t published_ = 0;
};

} // namespace farmlink
