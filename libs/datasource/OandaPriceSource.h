// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_OANDA_PRICE_SOURCE_H
#define __STATARB_OANDA_PRICE_SOURCE_H 1

#include <map>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "PriceSource.h"

namespace statarb
{
  // One page of the candles endpoint
  struct CandleBatch
  {
    // Every candle in the page, complete or not
    std::size_t numCandles = 0;

    // (time, mid close) of the complete candles in page order
    std::vector<std::pair<ptime, double>> completeCandles;
  };

  //
  // class OandaPriceSource
  //
  // Mid close prices from the OANDA v20 candles endpoint. Requests are paged
  // by start time in batches of getMaxBatchSize() candles. Incomplete candles
  // are skipped. The quote currency is taken from the instrument name
  // (EUR_USD is quoted in USD) unless an override is given.
  //
  class OandaPriceSource : public PriceSource
  {
  public:
    static const std::string PracticeUrl;
    static const std::string LiveUrl;

    // environment is "practice" or "live" ("trade" and "fxtrade" also accepted)
    OandaPriceSource(const std::string& apiToken,
		     const std::string& environment = "practice",
		     const std::map<std::string, std::string>& instrumentCurrencies = {});

    PriceSeries fetch(const std::string& ticker,
		      const DateRange& range,
		      const BarInterval& interval) override;

    const std::string& getBaseUrl() const
    {
      return mBaseUrl;
    }

    std::string getInstrumentCurrency(const std::string& instrument) const;

    std::string buildCandlesUri(const std::string& instrument,
				const std::string& granularity,
				const ptime& from) const;

    static std::size_t getMaxBatchSize()
    {
      return 5000;
    }

    // Maps "1m".."1w" or a native code such as "H4" to the API granularity
    static std::string getGranularity(const std::string& interval);

    static boost::posix_time::time_duration getGranularityLength(const std::string& granularity);

    /**
     * @brief Parses a candles response body.
     *
     * @throws PriceSourceIOException if the body is not valid JSON, is an API
     * error or a complete candle lacks its time or mid close.
     */
    static CandleBatch parseCandles(const std::string& payload);

  protected:
    // Performs the GET and returns the body; overridden in tests
    virtual std::string httpGet(const std::string& uri) const;

  private:
    std::string mApiToken;
    std::string mBaseUrl;
    std::map<std::string, std::string> mInstrumentCurrencies;
  };
}

#endif
