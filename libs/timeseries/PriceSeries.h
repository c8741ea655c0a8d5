// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_PRICE_SERIES_H
#define __STATARB_PRICE_SERIES_H 1

#include <string>
#include <vector>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/container/flat_map.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/local_time/local_time.hpp>
#include "DateRange.h"
#include "StatArbException.h"
#include "UtcTime.h"

namespace statarb
{
  using boost::posix_time::ptime;

  //
  // class PriceSeries
  //
  // Prices of one instrument keyed by UTC time stamp, together with the ISO
  // code of the currency the prices are quoted in. Entries are kept sorted by
  // time stamp regardless of insertion order. A price may be NaN to mark a
  // missing observation; PairAligner drops such rows.
  //
  class PriceSeries
  {
    using Map = boost::container::flat_map<ptime, double>;

  public:
    typedef Map::const_iterator ConstTimeSeriesIterator;

    PriceSeries(const std::string& symbol, const std::string& currency)
      : mSymbol(symbol),
	mCurrency(boost::to_upper_copy(boost::trim_copy(currency))),
	mSortedTimeSeries()
    {
      if (mCurrency.empty())
	throw ConfigurationException("PriceSeries: currency code for " + symbol + " must not be empty");
    }

    PriceSeries(const PriceSeries&) = default;
    PriceSeries(PriceSeries&&) noexcept = default;
    PriceSeries& operator=(const PriceSeries&) = default;
    PriceSeries& operator=(PriceSeries&&) noexcept = default;
    ~PriceSeries() = default;

    // A naive time stamp is taken to be UTC
    void addEntry(const ptime& utcDateTime, double price)
    {
      if (utcDateTime.is_special())
	throw std::domain_error("PriceSeries:addEntry: " + mSymbol + " time stamp must not be a special value");

      auto result = mSortedTimeSeries.emplace(utcDateTime, price);
      if (!result.second)
	throw DuplicateTimestampException("PriceSeries:addEntry: " + mSymbol
					  + " entry for time already exists: "
					  + boost::posix_time::to_simple_string(utcDateTime));
    }

    void addEntry(const boost::local_time::local_date_time& dateTime, double price)
    {
      addEntry(toUtc(dateTime), price);
    }

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const std::string& getCurrency() const
    {
      return mCurrency;
    }

    unsigned long getNumEntries() const
    {
      return mSortedTimeSeries.size();
    }

    bool empty() const
    {
      return mSortedTimeSeries.empty();
    }

    ConstTimeSeriesIterator beginSortedAccess() const
    {
      return mSortedTimeSeries.begin();
    }

    ConstTimeSeriesIterator endSortedAccess() const
    {
      return mSortedTimeSeries.end();
    }

    bool isDateTimeFound(const ptime& dateTime) const
    {
      return mSortedTimeSeries.find(dateTime) != mSortedTimeSeries.end();
    }

    double getValue(const ptime& dateTime) const
    {
      auto it = mSortedTimeSeries.find(dateTime);
      if (it == mSortedTimeSeries.end())
	throw PriceDataNotFoundException("PriceSeries:getValue: " + mSymbol + " has no entry for "
					 + boost::posix_time::to_simple_string(dateTime));
      return it->second;
    }

    const ptime& getFirstDateTime() const
    {
      if (mSortedTimeSeries.empty())
	throw std::domain_error("PriceSeries:getFirstDateTime: no entries in " + mSymbol);

      return mSortedTimeSeries.begin()->first;
    }

    const ptime& getLastDateTime() const
    {
      if (mSortedTimeSeries.empty())
	throw std::domain_error("PriceSeries:getLastDateTime: no entries in " + mSymbol);

      return mSortedTimeSeries.rbegin()->first;
    }

    std::vector<ptime> getDateTimesAsVector() const
    {
      std::vector<ptime> dateTimes;
      dateTimes.reserve(mSortedTimeSeries.size());
      for (const auto& kv : mSortedTimeSeries)
	dateTimes.push_back(kv.first);

      return dateTimes;
    }

    std::vector<double> getTimeSeriesAsVector() const
    {
      std::vector<double> series;
      series.reserve(mSortedTimeSeries.size());
      for (const auto& kv : mSortedTimeSeries)
	series.push_back(kv.second);

      return series;
    }

    // Copy holding only the entries inside range (inclusive at both ends)
    PriceSeries filter(const DateRange& range) const
    {
      PriceSeries result(mSymbol, mCurrency);
      auto first = mSortedTimeSeries.lower_bound(range.getFirstDateTime());
      auto last = mSortedTimeSeries.upper_bound(range.getLastDateTime());

      result.mSortedTimeSeries.reserve(std::distance(first, last));
      for (auto it = first; it != last; ++it)
	result.mSortedTimeSeries.emplace_hint(result.mSortedTimeSeries.end(), it->first, it->second);

      return result;
    }

  private:
    std::string mSymbol;
    std::string mCurrency;
    Map mSortedTimeSeries;
  };
}

#endif
