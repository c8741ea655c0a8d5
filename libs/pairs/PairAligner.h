// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_PAIR_ALIGNER_H
#define __STATARB_PAIR_ALIGNER_H 1

#include <map>
#include <ostream>
#include <string>
#include <boost/optional.hpp>
#include "AlignedPair.h"
#include "CurrencyPair.h"
#include "PriceSeries.h"
#include "PriceSource.h"

namespace statarb
{
  // Instrument ticker -> FX ticker used to bring it into the base currency
  using FxTickerMap = std::map<std::string, std::string>;

  //
  // class PairAligner
  //
  // Puts two legs on their common time stamps and converts both into the
  // base currency.
  //
  class PairAligner
  {
  public:
    explicit PairAligner(const std::string& baseCurrency = "USD",
			 std::ostream* diagnostics = nullptr);

    const std::string& getBaseCurrency() const
    {
      return mBaseCurrency;
    }

    /**
     * @brief Aligns two legs and converts them into the base currency.
     *
     * The result holds the time stamps present in both legs and in every FX
     * series a conversion needs. Rows where any of those values is not finite
     * are dropped. fxA and fxB are the FX series for legs A and B; they are
     * only consulted when that leg is not already in the base currency, and
     * their symbols must name a currency pair.
     *
     * @throws ConfigurationException if a leg needs conversion but has no FX series
     * or the FX symbol is not a currency pair.
     * @throws CurrencyIncompatibilityException if the FX pair cannot convert the leg.
     */
    AlignedPair align(const PriceSeries& legA,
		      const PriceSeries& legB,
		      const boost::optional<PriceSeries>& fxA = boost::none,
		      const boost::optional<PriceSeries>& fxB = boost::none) const;

    /**
     * @brief Fetches both legs and any FX series they need, then aligns them.
     *
     * FX tickers are resolved per leg from fxTickers. Each distinct FX ticker
     * is fetched once, from fxSource when given and from source otherwise.
     */
    AlignedPair load(PriceSource& source,
		     const std::string& tickerA,
		     const std::string& tickerB,
		     const DateRange& range,
		     const BarInterval& interval,
		     const FxTickerMap& fxTickers = FxTickerMap(),
		     PriceSource* fxSource = nullptr) const;

    // Same as above with one FX ticker used for every leg that needs conversion
    AlignedPair load(PriceSource& source,
		     const std::string& tickerA,
		     const std::string& tickerB,
		     const DateRange& range,
		     const BarInterval& interval,
		     const std::string& fxTicker,
		     PriceSource* fxSource = nullptr) const;

  private:
    bool needsConversion(const PriceSeries& leg) const;
    void checkFxSeries(const PriceSeries& leg, const boost::optional<PriceSeries>& fx) const;

  private:
    std::string mBaseCurrency;
    std::ostream* mDiagnostics;
  };
}

#endif
