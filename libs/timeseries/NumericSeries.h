// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_NUMERIC_SERIES_H
#define __STATARB_NUMERIC_SERIES_H 1

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace statarb
{
  using boost::posix_time::ptime;

  // Time stamps shared by several series computed over the same index
  using TimeIndex = std::shared_ptr<const std::vector<ptime>>;

  inline TimeIndex makeTimeIndex(std::vector<ptime> dateTimes)
  {
    return std::make_shared<const std::vector<ptime>>(std::move(dateTimes));
  }

  //
  // class NumericSeries
  //
  // Immutable sequence of values over a time index, e.g. a spread or an
  // equity curve.
  //
  class NumericSeries
  {
  public:
    NumericSeries()
      : mIndex(makeTimeIndex({})),
	mValues()
    {}

    NumericSeries(TimeIndex index, std::vector<double> values)
      : mIndex(std::move(index)),
	mValues(std::move(values))
    {
      if (!mIndex)
	throw std::invalid_argument("NumericSeries: time index must not be null");

      if (mIndex->size() != mValues.size())
	throw std::invalid_argument("NumericSeries: " + std::to_string(mValues.size())
				    + " values for " + std::to_string(mIndex->size()) + " time stamps");
    }

    NumericSeries(std::vector<ptime> dateTimes, std::vector<double> values)
      : NumericSeries(makeTimeIndex(std::move(dateTimes)), std::move(values))
    {}

    std::size_t size() const
    {
      return mValues.size();
    }

    bool empty() const
    {
      return mValues.empty();
    }

    const TimeIndex& getTimeIndex() const
    {
      return mIndex;
    }

    const std::vector<ptime>& getDateTimes() const
    {
      return *mIndex;
    }

    const std::vector<double>& getValues() const
    {
      return mValues;
    }

    const ptime& getDateTime(std::size_t i) const
    {
      return mIndex->at(i);
    }

    double getValue(std::size_t i) const
    {
      return mValues.at(i);
    }

  private:
    TimeIndex mIndex;
    std::vector<double> mValues;
  };

  //
  // class OptionalSeries
  //
  // Series whose points are either a value or undefined, used for rolling
  // statistics that have no value until a full window of history exists.
  //
  class OptionalSeries
  {
  public:
    OptionalSeries()
      : mIndex(makeTimeIndex({})),
	mValues()
    {}

    OptionalSeries(TimeIndex index, std::vector<boost::optional<double>> values)
      : mIndex(std::move(index)),
	mValues(std::move(values))
    {
      if (!mIndex)
	throw std::invalid_argument("OptionalSeries: time index must not be null");

      if (mIndex->size() != mValues.size())
	throw std::invalid_argument("OptionalSeries: " + std::to_string(mValues.size())
				    + " values for " + std::to_string(mIndex->size()) + " time stamps");
    }

    std::size_t size() const
    {
      return mValues.size();
    }

    bool empty() const
    {
      return mValues.empty();
    }

    const TimeIndex& getTimeIndex() const
    {
      return mIndex;
    }

    const std::vector<ptime>& getDateTimes() const
    {
      return *mIndex;
    }

    const boost::optional<double>& getValue(std::size_t i) const
    {
      return mValues.at(i);
    }

    bool isDefined(std::size_t i) const
    {
      return static_cast<bool>(mValues.at(i));
    }

    std::size_t getNumDefined() const
    {
      std::size_t count = 0;
      for (const auto& v : mValues)
	if (v)
	  ++count;

      return count;
    }

    const std::vector<boost::optional<double>>& getValues() const
    {
      return mValues;
    }

  private:
    TimeIndex mIndex;
    std::vector<boost::optional<double>> mValues;
  };
}

#endif
