// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cctype>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "TimeFrameUtility.h"
#include "StatArbException.h"

namespace statarb
{
  using boost::posix_time::minutes;
  using boost::posix_time::hours;

  static BarInterval makeInterval(long count, const std::string& unit, const std::string& original)
  {
    if (count <= 0)
      throw ConfigurationException("getBarIntervalFromString - interval " + original + " must be positive");

    const std::string countStr = boost::lexical_cast<std::string>(count);

    if (unit == "m" || unit == "min")
      return BarInterval(TimeFrame::INTRADAY, minutes(count), countStr + "m");
    else if (unit == "h")
      return BarInterval(TimeFrame::INTRADAY, hours(count), countStr + "h");
    else if (unit == "d" && count == 1)
      return BarInterval(TimeFrame::DAILY, hours(24), "1d");
    else if ((unit == "w" || unit == "wk") && count == 1)
      return BarInterval(TimeFrame::WEEKLY, hours(24 * 7), "1w");
    else
      throw ConfigurationException("getBarIntervalFromString - interval " + original + " not supported");
  }

  BarInterval getBarIntervalFromString(const std::string& intervalString)
  {
    const std::string trimmed = boost::trim_copy(intervalString);
    const std::string lowerCaseStr = boost::to_lower_copy(trimmed);

    if (lowerCaseStr.empty())
      throw ConfigurationException("getBarIntervalFromString - interval string must not be empty");

    if (lowerCaseStr == "daily")
      return makeInterval(1, "d", intervalString);
    else if (lowerCaseStr == "hourly")
      return makeInterval(1, "h", intervalString);
    else if (lowerCaseStr == "weekly")
      return makeInterval(1, "w", intervalString);

    std::string::size_type pos = 0;
    while (pos < lowerCaseStr.size() && std::isdigit(static_cast<unsigned char>(lowerCaseStr[pos])))
      ++pos;

    if (pos == 0 || pos == lowerCaseStr.size())
      throw ConfigurationException("getBarIntervalFromString - interval " + intervalString + " not recognized");

    long count = 0;
    try
      {
	count = boost::lexical_cast<long>(lowerCaseStr.substr(0, pos));
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw ConfigurationException("getBarIntervalFromString - interval " + intervalString + " not recognized");
      }

    return makeInterval(count, lowerCaseStr.substr(pos), intervalString);
  }
}
