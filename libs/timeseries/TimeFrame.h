// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_TIME_FRAME_H
#define __STATARB_TIME_FRAME_H 1

#include <string>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace statarb
{
  class TimeFrame
  {
  public:
    enum Duration {INTRADAY, DAILY, WEEKLY} ;
  };

  //
  // class BarInterval
  //
  // Bar frequency requested from a PriceSource, e.g. "1d" or "15m". The
  // canonical string is the one a PriceSource receives; getBarLength() is the
  // spacing between consecutive bars.
  //
  class BarInterval
  {
  public:
    BarInterval(TimeFrame::Duration timeFrame,
		const boost::posix_time::time_duration& barLength,
		const std::string& canonicalName)
      : mTimeFrame(timeFrame),
	mBarLength(barLength),
	mCanonicalName(canonicalName)
    {}

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeFrame;
    }

    const boost::posix_time::time_duration& getBarLength() const
    {
      return mBarLength;
    }

    const std::string& toString() const
    {
      return mCanonicalName;
    }

    long getBarLengthInMinutes() const
    {
      return static_cast<long>(mBarLength.total_seconds() / 60);
    }

  private:
    TimeFrame::Duration mTimeFrame;
    boost::posix_time::time_duration mBarLength;
    std::string mCanonicalName;
  };

  inline bool operator==(const BarInterval& lhs, const BarInterval& rhs)
  {
    return lhs.getBarLength() == rhs.getBarLength();
  }

  inline bool operator!=(const BarInterval& lhs, const BarInterval& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
