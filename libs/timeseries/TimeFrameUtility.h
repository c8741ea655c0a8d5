// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_TIME_FRAME_UTILITY_H
#define __STATARB_TIME_FRAME_UTILITY_H 1

#include <string>
#include "TimeFrame.h"

namespace statarb
{
  // Parses interval strings such as "1m", "15min", "1h", "4H", "1d", "1D",
  // "1w", "1wk", "daily", "hourly" or "weekly". Throws ConfigurationException
  // for anything else.
  extern BarInterval getBarIntervalFromString(const std::string& intervalString);
}

#endif
