#pragma once
#include <string_view>

#include "farmlink/farm_state.h"

// Domain enum string conversions (schema-stable strings used in store payloads and console output).
namespace farmlink
{
namespace domain_strings
{
    using StringView = std::string_view;

    StringView to_string(Severity v);
    StringView to_string(SessionPhase v);
    StringView to_string(ScheduleField v);
    StringView to_string(FeedStatus v);
    StringView to_string(AmmoniaStatus v);

    // Parses a schedule wire key such as "egg_time" (case-insensitive).
    bool scheduleField_fromKey(const char *key, ScheduleField &out);

    inline const char *c_str(StringView v)
    {
        return v.data();
    }
} // namespace domain_strings

inline const char *toString(Severity v) { return domain_strings::c_str(domain_strings::to_string(v)); }
inline const char *toString(SessionPhase v) { return domain_strings::c_str(domain_strings::to_string(v)); }
inline const char *toString(ScheduleField v) { return domain_strings::c_str(domain_strings::to_string(v)); }
inline const char *toString(FeedStatus v) { return domain_strings::c_str(domain_strings::to_string(v)); }
inline const char *toString(AmmoniaStatus v) { return domain_strings::c_str(domain_strings::to_string(v)); }

} // namespace farmlink
