// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_YAHOO_PRICE_SOURCE_H
#define __STATARB_YAHOO_PRICE_SOURCE_H 1

#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "PriceSource.h"

namespace statarb
{
  // Parsed body of the chart endpoint
  struct ChartResponse
  {
    // Listing currency from meta.currency, USD when absent
    std::string currency;

    // (UTC time, close) in response order; NaN where Yahoo has no price
    std::vector<std::pair<ptime, double>> closes;
  };

  //
  // class YahooPriceSource
  //
  // Close prices from the public Yahoo Finance chart endpoint. The adjusted
  // close is used when the response carries one, the raw close otherwise.
  //
  class YahooPriceSource : public PriceSource
  {
  public:
    static const std::string ChartUrl;

    explicit YahooPriceSource(bool useAdjustedClose = true);

    PriceSeries fetch(const std::string& ticker,
		      const DateRange& range,
		      const BarInterval& interval) override;

    bool getUseAdjustedClose() const
    {
      return mUseAdjustedClose;
    }

    std::string buildChartUri(const std::string& ticker,
			      const std::string& chartInterval,
			      const DateRange& range) const;

    // Maps "1m".."1w" to the chart interval codes ("60m", "1d", "1wk", ...)
    static std::string getChartInterval(const std::string& interval);

    /**
     * @brief Parses a chart response body.
     *
     * @throws PriceDataNotFoundException if Yahoo reports the symbol unknown.
     * @throws PriceSourceIOException if the body is not valid JSON, carries
     * another API error or lacks the time stamps or close prices.
     */
    static ChartResponse parseChart(const std::string& payload, bool useAdjustedClose = true);

  protected:
    // Performs the GET and returns the body; overridden in tests
    virtual std::string httpGet(const std::string& uri) const;

  private:
    bool mUseAdjustedClose;
  };
}

#endif
