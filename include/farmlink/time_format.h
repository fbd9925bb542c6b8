#pragma once

#include <stddef.h>
#include <stdint.h>

#include "farmlink/farm_state.h"

namespace farmlink
{
namespace time_format
{
// Strict parser for 24h "HH:MM" (zero-padded, 00:00..23:59).
// Returns false and leaves out untouched on any other shape.
bool parseTimeOfDay(const char *value, TimeOfDay &out);

// Formats as zero-padded "HH:MM". Needs outSize >= 6; invalid times produce an empty string.
bool formatTimeOfDay(const TimeOfDay &t, char *out, size_t outSize);

// Formats epoch milliseconds as local wall-clock "HH:MM:SS". Needs outSize >= 9.
bool formatLocalClock(uint64_t epochMs, char *out, size_t outSize);
} // namespace time_format
} // namespace farmlink
