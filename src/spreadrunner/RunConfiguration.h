// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <map>
#include <string>
#include <vector>
#include <boost/date_time.hpp>
#include "CsvPriceSource.h"
#include "DateRange.h"
#include "PairAligner.h"
#include "TimeFrame.h"

namespace statarb
{
  //
  // class RunConfiguration
  //
  // One pair study: the two legs, the currency to compare them in, the data
  // to load and the backtest parameters.
  //
  class RunConfiguration
  {
  public:
    RunConfiguration(const std::string& tickerA,
		     const std::string& tickerB,
		     const std::string& baseCurrency,
		     const BarInterval& interval,
		     const DateRange& range,
		     const std::vector<unsigned int>& windows,
		     double numStd,
		     double fee,
		     bool addIntercept)
      : mTickerA(tickerA),
	mTickerB(tickerB),
	mBaseCurrency(baseCurrency),
	mInterval(interval),
	mRange(range),
	mWindows(windows),
	mNumStd(numStd),
	mFee(fee),
	mAddIntercept(addIntercept)
    {}

    const std::string& getTickerA() const
    {
      return mTickerA;
    }

    const std::string& getTickerB() const
    {
      return mTickerB;
    }

    const std::string& getBaseCurrency() const
    {
      return mBaseCurrency;
    }

    const BarInterval& getInterval() const
    {
      return mInterval;
    }

    const DateRange& getDateRange() const
    {
      return mRange;
    }

    const std::vector<unsigned int>& getWindows() const
    {
      return mWindows;
    }

    double getNumStd() const
    {
      return mNumStd;
    }

    double getFee() const
    {
      return mFee;
    }

    bool getAddIntercept() const
    {
      return mAddIntercept;
    }

  private:
    std::string mTickerA;
    std::string mTickerB;
    std::string mBaseCurrency;
    BarInterval mInterval;
    DateRange mRange;
    std::vector<unsigned int> mWindows;
    double mNumStd;
    double mFee;
    bool mAddIntercept;
  };

  //
  // class InstrumentConfiguration
  //
  // Where each instrument's prices come from, its quote currency and the FX
  // ticker that converts it to the base currency.
  //
  class InstrumentConfiguration
  {
  public:
    InstrumentConfiguration() = default;

    void addInstrument(const std::string& symbol,
		       const CsvSpecification& specification,
		       const std::string& fxTicker);

    const std::map<std::string, CsvSpecification>& getCsvSpecifications() const
    {
      return mCsvSpecifications;
    }

    const FxTickerMap& getFxTickers() const
    {
      return mFxTickers;
    }

    // Quote currency by symbol, used to override the OANDA naming rule
    std::map<std::string, std::string> getCurrencies() const;

  private:
    std::map<std::string, CsvSpecification> mCsvSpecifications;
    FxTickerMap mFxTickers;
  };

  class RunConfigurationFileReader
  {
  public:
    /**
     * @brief Reads the first run row of a file with columns
     * TickerA,TickerB,BaseCurrency,Interval,StartDate,EndDate,Windows,NumStd,Fee,AddIntercept.
     *
     * A header row is optional. Dates are YYYYMMDD or YYYYMMDDTHHMMSS; a date
     * without a time ends at 23:59:59. Windows are separated by ';'.
     *
     * @throws ConfigurationException on a missing file or invalid value.
     */
    static RunConfiguration readRunFile(const std::string& fileName);

    /**
     * @brief Reads rows Symbol,DataPath,Currency,FxTicker,PriceColumn,TimestampColumn.
     *
     * FxTicker, PriceColumn and TimestampColumn may be empty. With
     * checkPaths every DataPath must exist.
     */
    static InstrumentConfiguration readInstrumentFile(const std::string& fileName, bool checkPaths = true);

    static boost::posix_time::ptime parseConfigurationDate(const std::string& text, bool endOfDay);

    static std::vector<unsigned int> parseWindows(const std::string& text);

    static bool parseBoolean(const std::string& text);
  };
}
