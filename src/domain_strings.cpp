#include "farmlink/domain_strings.h"

#include <strings.h>

#if !defined(DOMAIN_STRINGS_STRICT)
#if !defined(NDEBUG)
#define DOMAIN_STRINGS_STRICT 1
#else
#define DOMAIN_STRINGS_STRICT 0
#endif
#endif

namespace
{
#if !DOMAIN_STRINGS_STRICT
constexpr farmlink::domain_strings::StringView kUnknown = "unknown";
#endif

constexpr const char *kScheduleKeys[farmlink::kScheduleFieldCount] = {
    "egg_time",
    "stool_time",
    "feed_time",
    "led_on",
    "led_off",
};
} // namespace

namespace farmlink
{
namespace domain_strings
{
    StringView to_string(Severity v)
    {
        switch (v)
        {
        case Severity::INFO:
            return "info";
        case Severity::SUCCESS:
            return "success";
        case Severity::ERROR:
            return "error";
        }
#if DOMAIN_STRINGS_STRICT
        __builtin_unreachable();
#else
        return kUnknown;
#endif
    }

    StringView to_string(SessionPhase v)
    {
        switch (v)
        {
        case SessionPhase::BOOTSTRAPPING:
            return "bootstrapping";
        case SessionPhase::AUTHENTICATING:
            return "authenticating";
        case SessionPhase::ACTIVE:
            return "active";
        case SessionPhase::TERMINATED:
            return "terminated";
        }
#if DOMAIN_STRINGS_STRICT
        __builtin_unreachable();
#else
        return kUnknown;
#endif
    }

    StringView to_string(ScheduleField v)
    {
        const size_t idx = static_cast<size_t>(v);
        if (idx < kScheduleFieldCount)
        {
            return kScheduleKeys[idx];
        }
#if DOMAIN_STRINGS_STRICT
        __builtin_unreachable();
#else
        return kUnknown;
#endif
    }

    StringView to_string(FeedStatus v)
    {
        switch (v)
        {
        case FeedStatus::LOW:
            return "LOW";
        case FeedStatus::MID:
            return "MID";
        case FeedStatus::FULL:
            return "FULL";
        }
#if DOMAIN_STRINGS_STRICT
        __builtin_unreachable();
#else
        return kUnknown;
#endif
    }

    StringView to_string(AmmoniaStatus v)
    {
        switch (v)
        {
        case AmmoniaStatus::SAFE:
            return "Safe";
        case AmmoniaStatus::HIGH:
            return "High";
        }
#if DOMAIN_STRINGS_STRICT
        __builtin_unreachable();
#else
        return kUnknown;
#endif
    }

    bool scheduleField_fromKey(const char *key, ScheduleField &out)
    {
        if (!key)
        {
            return false;
        }
        for (size_t i = 0; i < kScheduleFieldCount; ++i)
        {
            if (strcasecmp(kScheduleKeys[i], key) == 0)
            {
                out = static_cast<ScheduleField>(i);
                return true;
            }
        }
        return false;
    }
} // namespace domain_strings
} // namespace farmlink
