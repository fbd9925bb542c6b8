#include "farmlink/time_format.h"

#include <stdio.h>
#include <string.h>
#include <time.h>

namespace
{
static inline bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}
} // namespace

namespace farmlink
{
namespace time_format
{
bool parseTimeOfDay(const char *value, TimeOfDay &out)
{
    if (!value)
    {
        return false;
    }

    // Exact shape: HH:MM
    if (strlen(value) != 5 || value[2] != ':')
    {
        return false;
    }
    if (!isDigit(value[0]) || !isDigit(value[1]) || !isDigit(value[3]) || !isDigit(value[4]))
    {
        return false;
    }

    TimeOfDay parsed;
    parsed.hour = static_cast<uint8_t>((value[0] - '0') * 10 + (value[1] - '0'));
    parsed.minute = static_cast<uint8_t>((value[3] - '0') * 10 + (value[4] - '0'));
    if (!parsed.valid())
    {
        return false;
    }

    out = parsed;
    return true;
}

bool formatTimeOfDay(const TimeOfDay &t, char *out, size_t outSize)
{
    if (!out || outSize == 0)
    {
        return false;
    }

    out[0] = '\0';
    if (outSize < 6 || !t.valid())
    {
        return false;
    }

    const int written = snprintf(out, outSize, "%02u:%02u", (unsigned)t.hour, (unsigned)t.minute);
    return written == 5;
}

bool formatLocalClock(uint64_t epochMs, char *out, size_t outSize)
{
    if (!out || outSize == 0)
    {
        return false;
    }

    out[0] = '\0';
    if (outSize < 9)
    {
        return false;
    }

    const time_t t = static_cast<time_t>(epochMs / 1000u);
    struct tm tmLocal;
    memset(&tmLocal, 0, sizeof(tmLocal));
    if (!localtime_r(&t, &tmLocal))
    {
        return false;
    }

    const int written = snprintf(out, outSize, "%02d:%02d:%02d", tmLocal.tm_hour, tmLocal.tm_min, tmLocal.tm_sec);
    if (written <= 0 || static_cast<size_t>(written) >= outSize)
    {
        out[outSize - 1] = '\0';
        return false;
    }

    return true;
}
} // namespace time_format
} // namespace farmlink
