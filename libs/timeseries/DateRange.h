// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_DATE_RANGE_H
#define __STATARB_DATE_RANGE_H 1

#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "StatArbException.h"

namespace statarb
{
  using boost::posix_time::ptime;

  //
  // class DateRange
  //
  // Closed UTC interval [first, last] requested from a PriceSource. The first
  // date time must be strictly earlier than the last.
  //
  class DateRange
  {
  public:
    DateRange(const boost::gregorian::date& firstDate, const boost::gregorian::date& lastDate)
      : DateRange(ptime(firstDate), ptime(lastDate))
    {}

    DateRange(const ptime& firstDateTime, const ptime& lastDateTime)
      : mFirstDateTime(firstDateTime),
	mLastDateTime(lastDateTime)
    {
      if (firstDateTime.is_special() || lastDateTime.is_special())
	throw PriceRangeException("DateRange::DateRange - date times must not be special values");

      if (!(firstDateTime < lastDateTime))
	throw PriceRangeException("DateRange::DateRange - start "
				  + boost::posix_time::to_simple_string(firstDateTime)
				  + " must be earlier than end "
				  + boost::posix_time::to_simple_string(lastDateTime));
    }

    DateRange(const DateRange&) = default;
    DateRange& operator=(const DateRange&) = default;
    ~DateRange() noexcept = default;

    const ptime& getFirstDateTime() const
    {
      return mFirstDateTime;
    }

    const ptime& getLastDateTime() const
    {
      return mLastDateTime;
    }

    boost::gregorian::date getFirstDate() const
    {
      return mFirstDateTime.date();
    }

    boost::gregorian::date getLastDate() const
    {
      return mLastDateTime.date();
    }

    bool contains(const ptime& dateTime) const
    {
      return (dateTime >= mFirstDateTime) && (dateTime <= mLastDateTime);
    }

    std::string toString() const
    {
      return boost::posix_time::to_simple_string(mFirstDateTime) + " - "
	+ boost::posix_time::to_simple_string(mLastDateTime);
    }

  private:
    ptime mFirstDateTime;
    ptime mLastDateTime;
  };

  inline bool operator==(const DateRange& lhs, const DateRange& rhs)
  {
    return (lhs.getFirstDateTime() == rhs.getFirstDateTime()) &&
      (lhs.getLastDateTime() == rhs.getLastDateTime());
  }

  inline bool operator!=(const DateRange& lhs, const DateRange& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
