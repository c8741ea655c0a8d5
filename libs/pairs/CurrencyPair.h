// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_CURRENCY_PAIR_H
#define __STATARB_CURRENCY_PAIR_H 1

#include <string>
#include <vector>

namespace statarb
{
  //
  // class CurrencyPair
  //
  // FX quote convention: one unit of the base currency costs getFxRate()
  // units of the quote currency, e.g. EURUSD at 1.1 means 1 EUR = 1.1 USD.
  //
  class CurrencyPair
  {
  public:
    CurrencyPair(const std::string& ticker,
		 const std::string& baseCurrency,
		 const std::string& quoteCurrency);

    /**
     * @brief Builds a pair from an FX ticker such as "EURUSD", "EUR/USD",
     * "EUR_USD" or "EURUSD=X".
     *
     * Only the alphabetic characters of the ticker are considered and there
     * must be exactly six of them.
     *
     * @throws ConfigurationException if the ticker does not name a pair.
     */
    static CurrencyPair fromTicker(const std::string& ticker);

    const std::string& getTicker() const
    {
      return mTicker;
    }

    const std::string& getBaseCurrency() const
    {
      return mBaseCurrency;
    }

    const std::string& getQuoteCurrency() const
    {
      return mQuoteCurrency;
    }

    // true if this pair can translate prices between the two currencies
    bool canConvert(const std::string& fromCurrency, const std::string& toCurrency) const;

    // throws CurrencyIncompatibilityException unless canConvert()
    void requireConvertible(const std::string& fromCurrency, const std::string& toCurrency) const
    {
      getDirection(fromCurrency, toCurrency);
    }

    /**
     * @brief Translates a price in fromCurrency into toCurrency given the FX
     * rate observed at the same time.
     *
     * @throws CurrencyIncompatibilityException if the pair does not connect
     * the two currencies.
     */
    double convertPrice(double price,
			const std::string& fromCurrency,
			const std::string& toCurrency,
			double fxRate) const;

    std::vector<double> convert(const std::vector<double>& prices,
				const std::string& fromCurrency,
				const std::string& toCurrency,
				const std::vector<double>& fxRates) const;

  private:
    enum class Direction {PassThrough, Multiply, Divide};

    Direction getDirection(const std::string& fromCurrency, const std::string& toCurrency) const;

  private:
    std::string mTicker;
    std::string mBaseCurrency;
    std::string mQuoteCurrency;
  };
}

#endif
