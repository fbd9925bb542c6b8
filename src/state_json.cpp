#include "farmlink/state_json.h"

#include <ArduinoJson.h>
#include <math.h>

#include "farmlink/devices.h"
#include "farmlink/domain_strings.h"
#include "farmlink/time_format.h"

namespace farmlink
{

namespace
{
// Capacity rationale (ArduinoJson v6): the largest record is /controls with 6 members or
// /schedule with 5 members + 5 copied "HH:MM" strings. Extra unknown members from the
// controller firmware are tolerated up to the headroom below.
static constexpr size_t kRecordMembersMax = 16;
static constexpr size_t kDecodeCapacity = JSON_OBJECT_SIZE(kRecordMembersMax) + 16 * JSON_STRING_SIZE(24);
static constexpr size_t kEncodeCapacity = JSON_OBJECT_SIZE(kDeviceCount) + kScheduleFieldCount * JSON_STRING_SIZE(6);

static constexpr const char *kTemperatureKey = "temperature";
static constexpr const char *kHumidityKey = "humidity";
static constexpr const char *kAmmoniaKey = "ammonia";
static constexpr const char *kFeedLevelKey = "feedLevel";

StateJsonError parseObject(const char *payload, size_t len, StaticJsonDocument<kDecodeCapacity> &doc)
{
    if (!payload || len == 0)
    {
        return StateJsonError::EMPTY;
    }

    const DeserializationError err = deserializeJson(doc, payload, len);
    if (err == DeserializationError::NoMemory)
    {
        return StateJsonError::DOC_OVERFLOW;
    }
    if (err)
    {
        return StateJsonError::INVALID_JSON;
    }
    if (doc.isNull())
    {
        return StateJsonError::EMPTY;
    }
    if (!doc.is<JsonObject>())
    {
        return StateJsonError::NOT_OBJECT;
    }
    return StateJsonError::OK;
}

StateJsonError readNumber(JsonObjectConst obj, const char *key, float &out)
{
    JsonVariantConst v = obj[key];
    if (v.isNull())
    {
        return StateJsonError::MISSING_FIELD;
    }
    if (!v.is<float>())
    {
        return StateJsonError::WRONG_TYPE;
    }
    const float value = v.as<float>();
    if (!isfinite(value))
    {
        return StateJsonError::WRONG_TYPE;
    }
    out = value;
    return StateJsonError::OK;
}

int clampPercent(float value)
{
    const long rounded = lroundf(value);
    if (rounded < 0)
        return 0;
    if (rounded > 100)
        return 100;
    return static_cast<int>(rounded);
}

StateJsonError finish(JsonDocument &doc, std::string &out)
{
    if (doc.overflowed())
    {
        return StateJsonError::DOC_OVERFLOW;
    }
    out.clear();
    if (serializeJson(doc, out) == 0)
    {
        return StateJsonError::SERIALIZE_FAILED;
    }
    return StateJsonError::OK;
}
} // namespace

const char *stateJsonErrorName(StateJsonError err)
{
    switch (err)
    {
    case StateJsonError::OK:
        return "ok";
    case StateJsonError::EMPTY:
        return "empty";
    case StateJsonError::INVALID_JSON:
        return "invalid_json";
    case StateJsonError::NOT_OBJECT:
        return "not_object";
    case StateJsonError::MISSING_FIELD:
        return "missing_field";
    case StateJsonError::WRONG_TYPE:
        return "wrong_type";
    case StateJsonError::DOC_OVERFLOW:
        return "doc_overflow";
    case StateJsonError::SERIALIZE_FAILED:
        return "serialize_failed";
    default:
        return "unknown";
    }
}

StateJsonError decodeSensors(const char *payload, size_t len, SensorSnapshot &out)
{
    StaticJsonDocument<kDecodeCapacity> doc;
    StateJsonError err = parseObject(payload, len, doc);
    if (err != StateJsonError::OK)
    {
        return err;
    }

    JsonObjectConst obj = doc.as<JsonObjectConst>();
    SensorSnapshot parsed;
    float feed = 0.0f;
    if ((err = readNumber(obj, kTemperatureKey, parsed.temperature)) != StateJsonError::OK ||
        (err = readNumber(obj, kHumidityKey, parsed.humidity)) != StateJsonError::OK ||
        (err = readNumber(obj, kAmmoniaKey, parsed.ammonia)) != StateJsonError::OK ||
        (err = readNumber(obj, kFeedLevelKey, feed)) != StateJsonError::OK)
    {
        return err;
    }
    parsed.feedLevel = clampPercent(feed);

    out = parsed;
    return StateJsonError::OK;
}

StateJsonError decodeControls(const char *payload, size_t len, ControlState &out)
{
    StaticJsonDocument<kDecodeCapacity> doc;
    const StateJsonError err = parseObject(payload, len, doc);
    if (err != StateJsonError::OK)
    {
        return err;
    }

    JsonObjectConst obj = doc.as<JsonObjectConst>();
    ControlState parsed;
    size_t count = 0;
    const DeviceInfo *catalog = device_catalog(count);
    for (size_t i = 0; i < count; ++i)
    {
        JsonVariantConst v = obj[catalog[i].key];
        if (v.isNull())
        {
            return StateJsonError::MISSING_FIELD;
        }
        if (!v.is<bool>())
        {
            return StateJsonError::WRONG_TYPE;
        }
        parsed.set(catalog[i].id, v.as<bool>());
    }

    out = parsed;
    return StateJsonError::OK;
}

StateJsonError decodeSchedule(const char *payload, size_t len, Schedule &out)
{
    StaticJsonDocument<kDecodeCapacity> doc;
    const StateJsonError err = parseObject(payload, len, doc);
    if (err != StateJsonError::OK)
    {
        return err;
    }

    JsonObjectConst obj = doc.as<JsonObjectConst>();
    Schedule parsed;
    for (size_t i = 0; i < kScheduleFieldCount; ++i)
    {
        const ScheduleField field = static_cast<ScheduleField>(i);
        JsonVariantConst v = obj[toString(field)];
        if (v.isNull())
        {
            return StateJsonError::MISSING_FIELD;
        }
        if (!v.is<const char *>())
        {
            return StateJsonError::WRONG_TYPE;
        }
        TimeOfDay t;
        if (!time_format::parseTimeOfDay(v.as<const char *>(), t))
        {
            return StateJsonError::WRONG_TYPE;
        }
        parsed.set(field, t);
    }

    out = parsed;
    return StateJsonError::OK;
}

StateJsonError encodeSensors(const SensorSnapshot &s, std::string &out)
{
    StaticJsonDocument<kEncodeCapacity> doc;
    doc[kTemperatureKey] = s.temperature;
    doc[kHumidityKey] = s.humidity;
    doc[kAmmoniaKey] = s.ammonia;
    doc[kFeedLevelKey] = s.feedLevel;
    return finish(doc, out);
}

StateJsonError encodeControls(const ControlState &c, std::string &out)
{
    StaticJsonDocument<kEncodeCapacity> doc;
    size_t count = 0;
    const DeviceInfo *catalog = device_catalog(count);
    for (size_t i = 0; i < count; ++i)
    {
        doc[catalog[i].key] = c.get(catalog[i].id);
    }
    return finish(doc, out);
}

StateJsonError encodeSchedule(const Schedule &s, std::string &out)
{
    StaticJsonDocument<kEncodeCapacity> doc;
    for (size_t i = 0; i < kScheduleFieldCount; ++i)
    {
        const ScheduleField field = static_cast<ScheduleField>(i);
        char buf[8];
        if (!time_format::formatTimeOfDay(s.get(field), buf, sizeof(buf)))
        {
            return StateJsonError::WRONG_TYPE;
        }
        // buf is a local, so ArduinoJson must copy it: pass as char* not const char*.
        doc[toString(field)] = static_cast<char *>(buf);
    }
    return finish(doc, out);
}

const char *encodeBool(bool value)
{
    return value ? "true" : "false";
}

} // namespace farmlink
