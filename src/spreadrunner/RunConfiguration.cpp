// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include <limits>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "RunConfiguration.h"
#include "StatArbException.h"
#include "TimeFrameUtility.h"

using namespace boost::filesystem;

namespace statarb
{
  using boost::posix_time::ptime;

  static double parseNonNegative(const std::string& text, const std::string& field)
  {
    double value;
    try
      {
	value = boost::lexical_cast<double>(boost::trim_copy(text));
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw ConfigurationException("RunConfigurationFileReader - " + field + " is not a number: " + text);
      }

    if (!std::isfinite(value) || value < 0.0)
      throw ConfigurationException("RunConfigurationFileReader - " + field
				   + " must be a non-negative number, got " + text);
    return value;
  }

  void InstrumentConfiguration::addInstrument(const std::string& symbol,
					      const CsvSpecification& specification,
					      const std::string& fxTicker)
  {
    if (!mCsvSpecifications.emplace(symbol, specification).second)
      throw ConfigurationException("InstrumentConfiguration::addInstrument - symbol " + symbol
				   + " listed more than once");

    if (!fxTicker.empty())
      mFxTickers[symbol] = fxTicker;
  }

  std::map<std::string, std::string> InstrumentConfiguration::getCurrencies() const
  {
    std::map<std::string, std::string> currencies;
    for (const auto& kv : mCsvSpecifications)
      currencies[kv.first] = kv.second.currency;

    return currencies;
  }

  ptime RunConfigurationFileReader::parseConfigurationDate(const std::string& text, bool endOfDay)
  {
    const std::string trimmed = boost::trim_copy(text);

    try
      {
	if (trimmed.size() == 8)
	  {
	    boost::gregorian::date d = boost::gregorian::from_undelimited_string(trimmed);
	    return endOfDay ? ptime(d, boost::posix_time::time_duration(23, 59, 59)) : ptime(d);
	  }
	else if (trimmed.size() == 15 && (trimmed[8] == 'T' || trimmed[8] == 't'))
	  return boost::posix_time::from_iso_string(boost::to_upper_copy(trimmed));
      }
    catch (const std::out_of_range&)
      {
      }
    catch (const boost::bad_lexical_cast&)
      {
      }

    throw ConfigurationException("RunConfigurationFileReader - bad date " + text
				 + ", expected YYYYMMDD or YYYYMMDDTHHMMSS");
  }

  std::vector<unsigned int> RunConfigurationFileReader::parseWindows(const std::string& text)
  {
    std::vector<std::string> parts;
    boost::split(parts, text, boost::is_any_of(";"));

    std::vector<unsigned int> windows;
    for (const std::string& part : parts)
      {
	const std::string trimmed = boost::trim_copy(part);
	if (trimmed.empty())
	  continue;

	long window;
	try
	  {
	    window = boost::lexical_cast<long>(trimmed);
	  }
	catch (const boost::bad_lexical_cast&)
	  {
	    throw ConfigurationException("RunConfigurationFileReader - window " + trimmed + " is not an integer");
	  }

	if (window <= 0)
	  throw ConfigurationException("RunConfigurationFileReader - window " + trimmed + " must be at least 1");

	if (static_cast<unsigned long>(window) > std::numeric_limits<unsigned int>::max())
	  throw ConfigurationException("RunConfigurationFileReader - window " + trimmed + " is too large");

	windows.push_back(static_cast<unsigned int>(window));
      }

    if (windows.empty())
      throw ConfigurationException("RunConfigurationFileReader - no windows given in " + text);

    return windows;
  }

  bool RunConfigurationFileReader::parseBoolean(const std::string& text)
  {
    const std::string lower = boost::to_lower_copy(boost::trim_copy(text));
    if (lower == "true" || lower == "yes" || lower == "1")
      return true;
    else if (lower == "false" || lower == "no" || lower == "0" || lower.empty())
      return false;

    throw ConfigurationException("RunConfigurationFileReader - expected true or false, got " + text);
  }

  RunConfiguration RunConfigurationFileReader::readRunFile(const std::string& fileName)
  {
    if (!exists(path(fileName)))
      throw ConfigurationException("Run configuration file " + fileName + " does not exist");

    std::string tickerA, tickerB, baseCurrency, intervalStr, startDateStr, endDateStr;
    std::string windowsStr, numStdStr, feeStr, addInterceptStr;
    bool found = false;

    try
      {
	io::CSVReader<10, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '"'>> csvConfigFile(fileName);
	csvConfigFile.set_header("TickerA", "TickerB", "BaseCurrency", "Interval", "StartDate",
				 "EndDate", "Windows", "NumStd", "Fee", "AddIntercept");

	while (csvConfigFile.read_row(tickerA, tickerB, baseCurrency, intervalStr, startDateStr,
				      endDateStr, windowsStr, numStdStr, feeStr, addInterceptStr))
	  {
	    if (boost::iequals(tickerA, "TickerA"))
	      continue;

	    found = true;
	    break;
	  }
      }
    catch (const io::error::base& e)
      {
	throw ConfigurationException("RunConfigurationFileReader::readRunFile - " + fileName + ": " + e.what());
      }

    if (!found)
      throw ConfigurationException("RunConfigurationFileReader::readRunFile - no run found in " + fileName);

    if (tickerA.empty() || tickerB.empty())
      throw ConfigurationException("RunConfigurationFileReader::readRunFile - both tickers are required");

    if (tickerA == tickerB)
      throw ConfigurationException("RunConfigurationFileReader::readRunFile - pair legs must differ, got "
				   + tickerA + " twice");

    const std::string base = boost::to_upper_copy(baseCurrency.empty() ? std::string("USD") : baseCurrency);
    BarInterval interval = getBarIntervalFromString(intervalStr);

    ptime start = parseConfigurationDate(startDateStr, false);
    ptime end = parseConfigurationDate(endDateStr, true);
    std::vector<unsigned int> windows = parseWindows(windowsStr);
    double numStd = parseNonNegative(numStdStr, "NumStd");
    double fee = parseNonNegative(feeStr, "Fee");
    bool addIntercept = parseBoolean(addInterceptStr);

    try
      {
	return RunConfiguration(tickerA, tickerB, base, interval, DateRange(start, end),
				windows, numStd, fee, addIntercept);
      }
    catch (const PriceRangeException& e)
      {
	throw ConfigurationException(std::string("RunConfigurationFileReader::readRunFile - ") + e.what());
      }
  }

  InstrumentConfiguration RunConfigurationFileReader::readInstrumentFile(const std::string& fileName,
									 bool checkPaths)
  {
    if (!exists(path(fileName)))
      throw ConfigurationException("Instrument file " + fileName + " does not exist");

    InstrumentConfiguration instruments;
    std::string symbol, dataPath, currency, fxTicker, priceColumn, timestampColumn;

    try
      {
	io::CSVReader<6, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '"'>> csvInstrumentFile(fileName);
	csvInstrumentFile.set_header("Symbol", "DataPath", "Currency", "FxTicker", "PriceColumn", "TimestampColumn");

	while (csvInstrumentFile.read_row(symbol, dataPath, currency, fxTicker, priceColumn, timestampColumn))
	  {
	    if (boost::iequals(symbol, "Symbol") || symbol.empty())
	      continue;

	    if (checkPaths && !exists(path(dataPath)))
	      throw ConfigurationException("Historic data file path " + dataPath + " for " + symbol
					   + " does not exist");

	    CsvSpecification specification(dataPath,
					   priceColumn.empty() ? std::string("close") : priceColumn,
					   timestampColumn.empty() ? std::string("timestamp") : timestampColumn,
					   currency.empty() ? std::string("USD") : boost::to_upper_copy(currency));
	    instruments.addInstrument(symbol, specification, fxTicker);
	  }
      }
    catch (const io::error::base& e)
      {
	throw ConfigurationException("RunConfigurationFileReader::readInstrumentFile - " + fileName + ": " + e.what());
      }

    return instruments;
  }
}
