// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_PRICE_SOURCE_H
#define __STATARB_PRICE_SOURCE_H 1

#include <string>
#include "DateRange.h"
#include "PriceSeries.h"
#include "TimeFrame.h"

namespace statarb
{
  /**
   * @brief Abstract supplier of historical prices for a single instrument.
   *
   * Implementations return the prices of ticker inside range (inclusive) at
   * the given bar interval, with time stamps in UTC and the currency the
   * prices are quoted in.
   *
   * @throws PriceDataNotFoundException if the ticker is unknown.
   * @throws PriceRangeException if no data lies inside the range.
   * @throws PriceSourceIOException on I/O failure.
   */
  class PriceSource
  {
  public:
    PriceSource() = default;
    virtual ~PriceSource() = default;

    PriceSource(const PriceSource&) = delete;
    PriceSource& operator=(const PriceSource&) = delete;

    virtual PriceSeries fetch(const std::string& ticker,
			      const DateRange& range,
			      const BarInterval& interval) = 0;
  };
}

#endif
