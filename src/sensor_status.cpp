#include "farmlink/sensor_status.h"

#include "farmlink/config.h"

namespace farmlink
{

FeedStatus sensor_feedStatus(int feedLevel)
{
    if (feedLevel < FARMLINK_CFG_FEED_LOW_BELOW)
        return FeedStatus::LOW;
    if (feedLevel < FARMLINK_CFG_FEED_MID_BELOW)
        return FeedStatus::MID;
    return FeedStatus::FULL;
}

AmmoniaStatus sensor_ammoniaStatus(float ammoniaPpm)
{
    return ammoniaPpm > FARMLINK_CFG_AMMONIA_HIGH_ABOVE ? AmmoniaStatus::HIGH : AmmoniaStatus::SAFE;
}

} // namespace farmlink
