// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_UTC_TIME_H
#define __STATARB_UTC_TIME_H 1

#include <ctime>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/local_time/local_time.hpp>

namespace statarb
{
  using boost::posix_time::ptime;

  /**
   * @brief Converts a timezone-aware time stamp to UTC.
   */
  inline ptime toUtc(const boost::local_time::local_date_time& localDateTime)
  {
    return localDateTime.utc_time();
  }

  /**
   * @brief Parses a textual time stamp into a UTC ptime.
   *
   * Accepted forms: "YYYYMMDD", "YYYY-MM-DD", optionally followed by a space or
   * 'T' and "HH:MM", "HH:MM:SS" or "HH:MM:SS.fff...", optionally followed by
   * 'Z' or an offset "+HH:MM", "-HH:MM", "+HHMM". A time stamp without an
   * offset is taken to be UTC already.
   *
   * @throws std::invalid_argument if the string cannot be parsed.
   */
  ptime parseUtcTimestamp(const std::string& timestamp);

  /**
   * @brief Formats a UTC ptime as "YYYY-MM-DDTHH:MM:SSZ".
   */
  std::string toIsoUtcString(const ptime& utcTime);

  std::time_t toEpochSeconds(const ptime& utcTime);
}

#endif
