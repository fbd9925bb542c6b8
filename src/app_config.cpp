#include "farmlink/app_config.h"

#include <ArduinoJson.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>

#include "farmlink/logger.h"

namespace farmlink
{

namespace
{
static constexpr size_t kConfigDocCapacity = 1024;
static constexpr size_t kConfigFileMax = 8192;
static constexpr uint32_t kIntervalMinMs = 100;
static constexpr uint32_t kIntervalMaxMs = 3600000;

ConfigError readBool(JsonObjectConst section, const char *key, bool &out)
{
    JsonVariantConst v = section[key];
    if (v.isNull())
    {
        return ConfigError::OK;
    }
    if (!v.is<bool>())
    {
        return ConfigError::WRONG_TYPE;
    }
    out = v.as<bool>();
    return ConfigError::OK;
}

ConfigError readUint(JsonObjectConst section, const char *key, uint32_t minValue, uint32_t maxValue, uint32_t &out)
{
    JsonVariantConst v = section[key];
    if (v.isNull())
    {
        return ConfigError::OK;
    }
    if (!v.is<long>())
    {
        return ConfigError::WRONG_TYPE;
    }
    const long value = v.as<long>();
    if (value < (long)minValue || value > (long)maxValue)
    {
        return ConfigError::OUT_OF_RANGE;
    }
    out = (uint32_t)value;
    return ConfigError::OK;
}

ConfigError readSection(JsonObjectConst root, const char *key, JsonObjectConst &out)
{
    JsonVariantConst v = root[key];
    if (v.isNull())
    {
        out = JsonObjectConst();
        return ConfigError::OK;
    }
    if (!v.is<JsonObjectConst>())
    {
        return ConfigError::WRONG_TYPE;
    }
    out = v.as<JsonObjectConst>();
    return ConfigError::OK;
}
} // namespace

const char *configErrorName(ConfigError err)
{
    switch (err)
    {
    case ConfigError::OK:
        return "ok";
    case ConfigError::NOT_FOUND:
        return "not_found";
    case ConfigError::READ_FAILED:
        return "read_failed";
    case ConfigError::INVALID_JSON:
        return "invalid_json";
    case ConfigError::NOT_OBJECT:
        return "not_object";
    case ConfigError::WRONG_TYPE:
        return "wrong_type";
    case ConfigError::OUT_OF_RANGE:
        return "out_of_range";
    default:
        return "unknown";
    }
}

bool simMode_fromString(const char *text, SimMode &out)
{
    if (!text)
    {
        return false;
    }
    if (strcasecmp(text, "normal") == 0)
    {
        out = SimMode::NORMAL;
        return true;
    }
    if (strcasecmp(text, "malformed") == 0)
    {
        out = SimMode::MALFORMED;
        return true;
    }
    if (strcasecmp(text, "silent") == 0)
    {
        out = SimMode::SILENT;
        return true;
    }
    return false;
}

const char *simMode_name(SimMode mode)
{
    switch (mode)
    {
    case SimMode::NORMAL:
        return "normal";
    case SimMode::MALFORMED:
        return "malformed";
    case SimMode::SILENT:
        return "silent";
    default:
        return "unknown";
    }
}

ConfigError appConfig_parse(const char *json, size_t len, AppConfig &out)
{
    StaticJsonDocument<kConfigDocCapacity> doc;
    const DeserializationError jsonErr = deserializeJson(doc, json, len);
    if (jsonErr)
    {
        return ConfigError::INVALID_JSON;
    }
    if (!doc.is<JsonObject>())
    {
        return ConfigError::NOT_OBJECT;
    }

    AppConfig cfg = out;
    ConfigError err = ConfigError::OK;
    JsonObjectConst root = doc.as<JsonObjectConst>();
    JsonObjectConst section;

    err = readSection(root, "log", section);
    if (err != ConfigError::OK)
    {
        return err;
    }
    err = readBool(section, "color", cfg.logColor);
    if (err != ConfigError::OK)
    {
        return err;
    }
    err = readBool(section, "high_freq", cfg.logHighFreq);
    if (err != ConfigError::OK)
    {
        return err;
    }

    err = readSection(root, "notifications", section);
    if (err != ConfigError::OK)
    {
        return err;
    }
    err = readBool(section, "enabled", cfg.notificationsEnabled);
    if (err != ConfigError::OK)
    {
        return err;
    }
    if (!section.isNull() && !section["title"].isNull())
    {
        if (!section["title"].is<const char *>())
        {
            return ConfigError::WRONG_TYPE;
        }
        cfg.notifyTitle = section["title"].as<const char *>();
    }

    err = readSection(root, "auth", section);
    if (err != ConfigError::OK)
    {
        return err;
    }
    err = readBool(section, "existing_session", cfg.authExistingSession);
    if (err != ConfigError::OK)
    {
        return err;
    }
    uint32_t failAttempts = cfg.authFailAttempts;
    err = readUint(section, "fail_attempts", 0, 255, failAttempts);
    if (err != ConfigError::OK)
    {
        return err;
    }
    cfg.authFailAttempts = (uint8_t)failAttempts;
    err = readUint(section, "retry_ms", 0, kIntervalMaxMs, cfg.authRetryMs);
    if (err != ConfigError::OK)
    {
        return err;
    }

    err = readSection(root, "simulation", section);
    if (err != ConfigError::OK)
    {
        return err;
    }
    err = readBool(section, "enabled", cfg.simulationEnabled);
    if (err != ConfigError::OK)
    {
        return err;
    }
    if (!section.isNull() && !section["mode"].isNull())
    {
        if (!section["mode"].is<const char *>())
        {
            return ConfigError::WRONG_TYPE;
        }
        if (!simMode_fromString(section["mode"].as<const char *>(), cfg.simulationMode))
        {
            return ConfigError::OUT_OF_RANGE;
        }
    }
    err = readUint(section, "sensor_interval_ms", kIntervalMinMs, kIntervalMaxMs, cfg.simulationIntervalMs);
    if (err != ConfigError::OK)
    {
        return err;
    }

    out = cfg;
    return ConfigError::OK;
}

ConfigError appConfig_load(const char *path, AppConfig &out)
{
    FILE *f = fopen(path, "rb");
    if (!f)
    {
        if (errno == ENOENT)
        {
            FARMLINK_LOG_INFO(LogDomain::CONFIG, "%s not found, using defaults", path);
            return ConfigError::NOT_FOUND;
        }
        FARMLINK_LOG_ERROR(LogDomain::CONFIG, "cannot open %s: %s", path, strerror(errno));
        return ConfigError::READ_FAILED;
    }

    std::string text;
    char buf[512];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0)
    {
        text.append(buf, n);
        if (text.size() > kConfigFileMax)
        {
            break;
        }
    }
    const bool readError = ferror(f) != 0;
    fclose(f);
    if (readError || text.size() > kConfigFileMax)
    {
        FARMLINK_LOG_ERROR(LogDomain::CONFIG, "cannot read %s", path);
        return ConfigError::READ_FAILED;
    }

    const ConfigError err = appConfig_parse(text.data(), text.size(), out);
    if (err != ConfigError::OK)
    {
        FARMLINK_LOG_ERROR(LogDomain::CONFIG, "%s rejected (%s), using defaults", path, configErrorName(err));
        return err;
    }
    FARMLINK_LOG_INFO(LogDomain::CONFIG, "loaded %s", path);
    return ConfigError::OK;
}

} // namespace farmlink
