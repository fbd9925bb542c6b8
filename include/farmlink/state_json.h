#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>

#include "farmlink/farm_state.h"

namespace farmlink
{

enum class StateJsonError : uint8_t
{
    OK = 0,
    EMPTY,         // null payload (key absent in the store)
    INVALID_JSON,
    NOT_OBJECT,
    MISSING_FIELD,
    WRONG_TYPE,
    DOC_OVERFLOW,
    SERIALIZE_FAILED
};

const char *stateJsonErrorName(StateJsonError err);

// Decoders are all-or-nothing: on any error `out` is left untouched.
// Contract: payload may be non null-terminated; len is its byte length.
StateJsonError decodeSensors(const char *payload, size_t len, SensorSnapshot &out);
StateJsonError decodeControls(const char *payload, size_t len, ControlState &out);
StateJsonError decodeSchedule(const char *payload, size_t len, Schedule &out);

inline StateJsonError decodeSensors(const std::string &payload, SensorSnapshot &out)
{
    return decodeSensors(payload.data(), payload.size(), out);
}
inline StateJsonError decodeControls(const std::string &payload, ControlState &out)
{
    return decodeControls(payload.data(), payload.size(), out);
}
inline StateJsonError decodeSchedule(const std::string &payload, Schedule &out)
{
    return decodeSchedule(payload.data(), payload.size(), out);
}

StateJsonError encodeSensors(const SensorSnapshot &s, std::string &out);
StateJsonError encodeControls(const ControlState &c, std::string &out);
StateJsonError encodeSchedule(const Schedule &s, std::string &out);

// JSON literal for a single actuator value ("true"/"false").
const char *encodeBool(bool value);

} // namespace farmlink
