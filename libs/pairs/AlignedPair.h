// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_ALIGNED_PAIR_H
#define __STATARB_ALIGNED_PAIR_H 1

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include "NumericSeries.h"

namespace statarb
{
  //
  // class AlignedPair
  //
  // Prices of two instruments on their common UTC time stamps, both legs
  // expressed in the base currency. getCurrencyA() and getCurrencyB() are the
  // currencies the legs were originally quoted in.
  //
  class AlignedPair
  {
  public:
    AlignedPair(const std::string& tickerA,
		const std::string& tickerB,
		const NumericSeries& legA,
		const NumericSeries& legB,
		const std::string& currencyA,
		const std::string& currencyB,
		const std::string& baseCurrency)
      : mTickerA(tickerA),
	mTickerB(tickerB),
	mLegA(legA),
	mLegB(legB),
	mCurrencyA(currencyA),
	mCurrencyB(currencyB),
	mBaseCurrency(baseCurrency)
    {
      if (mLegA.getDateTimes() != mLegB.getDateTimes())
	throw std::invalid_argument("AlignedPair: legs " + tickerA + " and " + tickerB
				    + " are not on the same time index");
    }

    const std::string& getTickerA() const
    {
      return mTickerA;
    }

    const std::string& getTickerB() const
    {
      return mTickerB;
    }

    std::size_t size() const
    {
      return mLegA.size();
    }

    bool empty() const
    {
      return mLegA.empty();
    }

    const std::vector<ptime>& getDateTimes() const
    {
      return mLegA.getDateTimes();
    }

    const TimeIndex& getTimeIndex() const
    {
      return mLegA.getTimeIndex();
    }

    const NumericSeries& getLegA() const
    {
      return mLegA;
    }

    const NumericSeries& getLegB() const
    {
      return mLegB;
    }

    const std::vector<double>& getValuesA() const
    {
      return mLegA.getValues();
    }

    const std::vector<double>& getValuesB() const
    {
      return mLegB.getValues();
    }

    const std::string& getCurrencyA() const
    {
      return mCurrencyA;
    }

    const std::string& getCurrencyB() const
    {
      return mCurrencyB;
    }

    const std::string& getBaseCurrency() const
    {
      return mBaseCurrency;
    }

  private:
    std::string mTickerA;
    std::string mTickerB;
    NumericSeries mLegA;
    NumericSeries mLegB;
    std::string mCurrencyA;
    std::string mCurrencyB;
    std::string mBaseCurrency;
  };
}

#endif
