#include "farmlink/farm_state.h"

#include "farmlink/config.h"
#include "farmlink/logger.h"
#include "farmlink/time_format.h"

namespace farmlink
{

static TimeOfDay parseDefault(const char *value)
{
    TimeOfDay t;
    if (!time_format::parseTimeOfDay(value, t))
    {
        FARMLINK_LOG_ERROR(LogDomain::CONFIG, "bad default schedule time '%s', using 00:00", value);
    }
    return t;
}

Schedule schedule_defaults()
{
    Schedule s;
    s.set(ScheduleField::EGG_TIME, parseDefault(FARMLINK_CFG_DEFAULT_EGG_TIME));
    s.set(ScheduleField::STOOL_TIME, parseDefault(FARMLINK_CFG_DEFAULT_STOOL_TIME));
    s.set(ScheduleField::FEED_TIME, parseDefault(FARMLINK_CFG_DEFAULT_FEED_TIME));
    s.set(ScheduleField::LED_ON, parseDefault(FARMLINK_CFG_DEFAULT_LED_ON));
    s.set(ScheduleField::LED_OFF, parseDefault(FARMLINK_CFG_DEFAULT_LED_OFF));
    return s;
}

} // namespace farmlink
