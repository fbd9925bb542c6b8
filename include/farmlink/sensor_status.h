#pragma once
#include "farmlink/farm_state.h"

namespace farmlink
{

// LOW below 20 %, MID below 60 %, FULL otherwise.
FeedStatus sensor_feedStatus(int feedLevel);

// HIGH above 20 ppm.
AmmoniaStatus sensor_ammoniaStatus(float ammoniaPpm);

} // namespace farmlink
