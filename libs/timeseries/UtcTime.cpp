// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include "UtcTime.h"

namespace statarb
{
  using boost::posix_time::time_duration;

  static bool allDigits(const std::string& s)
  {
    if (s.empty())
      return false;

    for (char c : s)
      if (!std::isdigit(static_cast<unsigned char>(c)))
	return false;

    return true;
  }

  static time_duration parseUtcOffset(const std::string& offset, const std::string& original)
  {
    // offset is the text after the sign: "HH:MM", "HHMM" or "HH"
    std::string digits = boost::erase_all_copy(offset, ":");
    if (!allDigits(digits) || (digits.size() != 2 && digits.size() != 4))
      throw std::invalid_argument("parseUtcTimestamp - bad UTC offset in " + original);

    const long offsetHours = std::stol(digits.substr(0, 2));
    const long offsetMinutes = (digits.size() == 4) ? std::stol(digits.substr(2, 2)) : 0;
    if (offsetHours > 23 || offsetMinutes > 59)
      throw std::invalid_argument("parseUtcTimestamp - bad UTC offset in " + original);

    return time_duration(offsetHours, offsetMinutes, 0);
  }

  static time_duration parseTimeOfDay(std::string timeString, const std::string& original)
  {
    // Keep at most microsecond precision
    std::string::size_type dot = timeString.find('.');
    if (dot != std::string::npos && timeString.size() > dot + 7)
      timeString.erase(dot + 7);

    if (std::count(timeString.begin(), timeString.end(), ':') == 1)
      timeString += ":00";

    try
      {
	time_duration timeOfDay = boost::posix_time::duration_from_string(timeString);
	if (timeOfDay.is_negative() || timeOfDay >= boost::posix_time::hours(24))
	  throw std::invalid_argument("parseUtcTimestamp - time of day out of range in " + original);

	return timeOfDay;
      }
    catch (const std::out_of_range&)
      {
	throw std::invalid_argument("parseUtcTimestamp - bad time of day in " + original);
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw std::invalid_argument("parseUtcTimestamp - bad time of day in " + original);
      }
  }

  static boost::gregorian::date parseDate(const std::string& dateString, const std::string& original)
  {
    try
      {
	if (dateString.size() == 8 && allDigits(dateString))
	  return boost::gregorian::from_undelimited_string(dateString);
	else if (dateString.size() == 10 && dateString[4] == '-' && dateString[7] == '-')
	  return boost::gregorian::from_simple_string(dateString);
      }
    catch (const std::out_of_range&)
      {
	// bad_year, bad_month and bad_day_of_month all derive from out_of_range
      }
    catch (const boost::bad_lexical_cast&)
      {
      }

    throw std::invalid_argument("parseUtcTimestamp - bad date in " + original);
  }

  ptime parseUtcTimestamp(const std::string& timestamp)
  {
    std::string text = boost::trim_copy(timestamp);
    if (text.empty())
      throw std::invalid_argument("parseUtcTimestamp - empty time stamp");

    time_duration offset(0, 0, 0);
    bool offsetIsNegative = false;

    if (text.back() == 'Z' || text.back() == 'z')
      text.pop_back();
    else
      {
	// An offset sign can only appear after the date portion
	std::string::size_type signPos = text.find_last_of("+-");
	if (signPos != std::string::npos && signPos > 10)
	  {
	    offsetIsNegative = (text[signPos] == '-');
	    offset = parseUtcOffset(text.substr(signPos + 1), timestamp);
	    text.erase(signPos);
	  }
      }

    std::string::size_type separator = text.find_first_of("T ");
    boost::gregorian::date datePart = parseDate(text.substr(0, separator), timestamp);

    time_duration timeOfDay(0, 0, 0);
    if (separator != std::string::npos)
      timeOfDay = parseTimeOfDay(boost::trim_copy(text.substr(separator + 1)), timestamp);

    ptime localTime(datePart, timeOfDay);

    // local = utc + offset
    return offsetIsNegative ? (localTime + offset) : (localTime - offset);
  }

  std::string toIsoUtcString(const ptime& utcTime)
  {
    std::string iso = boost::posix_time::to_iso_extended_string(utcTime);

    // drop fractional seconds
    std::string::size_type dot = iso.find('.');
    if (dot != std::string::npos)
      iso.erase(dot);

    return iso + "Z";
  }

  std::time_t toEpochSeconds(const ptime& utcTime)
  {
    static const ptime epoch(boost::gregorian::date(1970, 1, 1));
    return static_cast<std::time_t>((utcTime - epoch).total_seconds());
  }
}
