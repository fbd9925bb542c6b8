#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>

#include "farmlink/config.h"

namespace farmlink
{

// Simulated controller behaviour.
enum class SimMode : uint8_t
{
    NORMAL = 0,    // well-formed sensor snapshots
    MALFORMED = 1, // snapshots without the ammonia field
    SILENT = 2     // no snapshots at all
};

enum class ConfigError : uint8_t
{
    OK = 0,
    NOT_FOUND,    // file absent, defaults apply
    READ_FAILED,
    INVALID_JSON,
    NOT_OBJECT,
    WRONG_TYPE,
    OUT_OF_RANGE
};

const char *configErrorName(ConfigError err);

// Runtime settings, loaded from a JSON file at startup.
struct AppConfig
{
    bool logColor = FARMLINK_CFG_LOG_COLOR != 0;
    bool logHighFreq = FARMLINK_CFG_LOG_HIGH_FREQ_DEFAULT != 0;

    bool notificationsEnabled = true;
    std::string notifyTitle = FARMLINK_CFG_NOTIFY_TITLE;

    bool authExistingSession = false;
    uint8_t authFailAttempts = 0;
    uint32_t authRetryMs = FARMLINK_CFG_AUTH_RETRY_MS;

    bool simulationEnabled = true;
    SimMode simulationMode = SimMode::NORMAL;
    uint32_t simulationIntervalMs = FARMLINK_CFG_SIM_SENSOR_MS;
};

// Parses "normal" / "malformed" / "silent" (case-insensitive).
bool simMode_fromString(const char *text, SimMode &out);
const char *simMode_name(SimMode mode);

// Applies every recognised key from json over `out`. On error `out` is left untouched.
ConfigError appConfig_parse(const char *json, size_t len, AppConfig &out);

// NOT_FOUND leaves `out` at its current values (callers start from defaults).
ConfigError appConfig_load(const char *path, AppConfig &out);

} // namespace farmlink
