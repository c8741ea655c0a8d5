// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cctype>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include "CurrencyPair.h"
#include "StatArbException.h"

namespace statarb
{
  CurrencyPair::CurrencyPair(const std::string& ticker,
			     const std::string& baseCurrency,
			     const std::string& quoteCurrency)
    : mTicker(ticker),
      mBaseCurrency(boost::to_upper_copy(baseCurrency)),
      mQuoteCurrency(boost::to_upper_copy(quoteCurrency))
  {
    if (mBaseCurrency.size() != 3 || mQuoteCurrency.size() != 3)
      throw ConfigurationException("CurrencyPair: currency codes for " + ticker
				   + " must have three letters, got " + baseCurrency
				   + " and " + quoteCurrency);

    if (mBaseCurrency == mQuoteCurrency)
      throw ConfigurationException("CurrencyPair: " + ticker + " has the same base and quote currency "
				   + mBaseCurrency);
  }

  CurrencyPair CurrencyPair::fromTicker(const std::string& ticker)
  {
    std::string letters;
    for (char c : ticker)
      if (std::isalpha(static_cast<unsigned char>(c)))
	letters.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

    if (letters.size() != 6)
      throw ConfigurationException("CurrencyPair::fromTicker - unable to infer currency pair from FX ticker '"
				   + ticker + "': expected exactly six letters, found "
				   + std::to_string(letters.size()));

    return CurrencyPair(ticker, letters.substr(0, 3), letters.substr(3, 3));
  }

  CurrencyPair::Direction CurrencyPair::getDirection(const std::string& fromCurrency,
						     const std::string& toCurrency) const
  {
    const std::string from = boost::to_upper_copy(fromCurrency);
    const std::string to = boost::to_upper_copy(toCurrency);

    if (from == to)
      return Direction::PassThrough;
    else if (from == mBaseCurrency && to == mQuoteCurrency)
      return Direction::Multiply;
    else if (from == mQuoteCurrency && to == mBaseCurrency)
      return Direction::Divide;

    throw CurrencyIncompatibilityException("CurrencyPair: FX ticker " + mTicker + " ("
					   + mBaseCurrency + "/" + mQuoteCurrency
					   + ") is incompatible with conversion from "
					   + from + " to " + to);
  }

  bool CurrencyPair::canConvert(const std::string& fromCurrency, const std::string& toCurrency) const
  {
    try
      {
	getDirection(fromCurrency, toCurrency);
	return true;
      }
    catch (const CurrencyIncompatibilityException&)
      {
	return false;
      }
  }

  double CurrencyPair::convertPrice(double price,
				    const std::string& fromCurrency,
				    const std::string& toCurrency,
				    double fxRate) const
  {
    switch (getDirection(fromCurrency, toCurrency))
      {
      case Direction::Multiply:
	return price * fxRate;
      case Direction::Divide:
	return price / fxRate;
      case Direction::PassThrough:
      default:
	return price;
      }
  }

  std::vector<double> CurrencyPair::convert(const std::vector<double>& prices,
					    const std::string& fromCurrency,
					    const std::string& toCurrency,
					    const std::vector<double>& fxRates) const
  {
    if (prices.size() != fxRates.size())
      throw std::invalid_argument("CurrencyPair::convert - " + std::to_string(prices.size())
				  + " prices but " + std::to_string(fxRates.size())
				  + " FX rates for " + mTicker);

    const Direction direction = getDirection(fromCurrency, toCurrency);

    std::vector<double> converted;
    converted.reserve(prices.size());
    for (std::size_t i = 0; i < prices.size(); ++i)
      {
	if (direction == Direction::Multiply)
	  converted.push_back(prices[i] * fxRates[i]);
	else if (direction == Direction::Divide)
	  converted.push_back(prices[i] / fxRates[i]);
	else
	  converted.push_back(prices[i]);
      }

    return converted;
  }
}
