// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_IN_MEMORY_PRICE_SOURCE_H
#define __STATARB_IN_MEMORY_PRICE_SOURCE_H 1

#include <map>
#include <mutex>
#include <string>
#include "PriceSource.h"
#include "StatArbException.h"

namespace statarb
{
  //
  // class InMemoryPriceSource
  //
  // Serves series registered ahead of time. The interval argument is
  // ignored; series are returned at whatever resolution they were added.
  // Each fetch is counted per ticker.
  //
  class InMemoryPriceSource : public PriceSource
  {
  public:
    InMemoryPriceSource() = default;

    void addSeries(const PriceSeries& series)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      auto result = mSeries.emplace(series.getSymbol(), series);
      if (!result.second)
	throw ConfigurationException("InMemoryPriceSource::addSeries - series for "
				     + series.getSymbol() + " already registered");
    }

    PriceSeries fetch(const std::string& ticker,
		      const DateRange& range,
		      const BarInterval& interval) override
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mFetchCounts[ticker]++;

      auto it = mSeries.find(ticker);
      if (it == mSeries.end())
	throw PriceDataNotFoundException("InMemoryPriceSource::fetch - no data for ticker " + ticker);

      PriceSeries filtered = it->second.filter(range);
      if (filtered.empty())
	throw PriceRangeException("InMemoryPriceSource::fetch - no data for " + ticker
				  + " in " + range.toString() + " at interval " + interval.toString());

      return filtered;
    }

    unsigned int getFetchCount(const std::string& ticker) const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      auto it = mFetchCounts.find(ticker);
      return (it == mFetchCounts.end()) ? 0 : it->second;
    }

    unsigned int getTotalFetchCount() const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      unsigned int total = 0;
      for (const auto& kv : mFetchCounts)
	total += kv.second;

      return total;
    }

  private:
    std::map<std::string, PriceSeries> mSeries;
    std::map<std::string, unsigned int> mFetchCounts;
    mutable std::mutex mMutex;
  };
}

#endif
