// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include <boost/algorithm/string.hpp>
#include "PairAligner.h"
#include "StatArbException.h"

namespace statarb
{
  PairAligner::PairAligner(const std::string& baseCurrency, std::ostream* diagnostics)
    : mBaseCurrency(boost::to_upper_copy(boost::trim_copy(baseCurrency))),
      mDiagnostics(diagnostics)
  {
    if (mBaseCurrency.empty())
      throw ConfigurationException("PairAligner: base currency must not be empty");
  }

  bool PairAligner::needsConversion(const PriceSeries& leg) const
  {
    return leg.getCurrency() != mBaseCurrency;
  }

  void PairAligner::checkFxSeries(const PriceSeries& leg, const boost::optional<PriceSeries>& fx) const
  {
    if (needsConversion(leg) && !fx)
      throw ConfigurationException("PairAligner: currency for " + leg.getSymbol() + " is "
				   + leg.getCurrency() + ", but no FX ticker provided to convert to "
				   + mBaseCurrency + ". Supply an FX ticker for this instrument.");
  }

  AlignedPair PairAligner::align(const PriceSeries& legA,
				 const PriceSeries& legB,
				 const boost::optional<PriceSeries>& fxA,
				 const boost::optional<PriceSeries>& fxB) const
  {
    checkFxSeries(legA, fxA);
    checkFxSeries(legB, fxB);

    const PriceSeries* fxSeriesA = needsConversion(legA) ? fxA.get_ptr() : nullptr;
    const PriceSeries* fxSeriesB = needsConversion(legB) ? fxB.get_ptr() : nullptr;

    // Validate the FX tickers before doing any work
    boost::optional<CurrencyPair> pairA;
    boost::optional<CurrencyPair> pairB;
    if (fxSeriesA)
      {
	pairA = CurrencyPair::fromTicker(fxSeriesA->getSymbol());
	pairA->requireConvertible(legA.getCurrency(), mBaseCurrency);
      }

    if (fxSeriesB)
      {
	pairB = CurrencyPair::fromTicker(fxSeriesB->getSymbol());
	pairB->requireConvertible(legB.getCurrency(), mBaseCurrency);
      }

    std::vector<ptime> dateTimes;
    std::vector<double> valuesA, valuesB, ratesA, ratesB;
    unsigned long numIncomplete = 0;

    PriceSeries::ConstTimeSeriesIterator it = legA.beginSortedAccess();
    for (; it != legA.endSortedAccess(); ++it)
      {
	const ptime& dateTime = it->first;

	if (!legB.isDateTimeFound(dateTime))
	  continue;
	if (fxSeriesA && !fxSeriesA->isDateTimeFound(dateTime))
	  continue;
	if (fxSeriesB && !fxSeriesB->isDateTimeFound(dateTime))
	  continue;

	const double a = it->second;
	const double b = legB.getValue(dateTime);
	const double rateA = fxSeriesA ? fxSeriesA->getValue(dateTime) : 1.0;
	const double rateB = fxSeriesB ? fxSeriesB->getValue(dateTime) : 1.0;

	if (!std::isfinite(a) || !std::isfinite(b) || !std::isfinite(rateA) || !std::isfinite(rateB))
	  {
	    ++numIncomplete;
	    continue;
	  }

	dateTimes.push_back(dateTime);
	valuesA.push_back(a);
	valuesB.push_back(b);
	ratesA.push_back(rateA);
	ratesB.push_back(rateB);
      }

    if (pairA)
      valuesA = pairA->convert(valuesA, legA.getCurrency(), mBaseCurrency, ratesA);
    if (pairB)
      valuesB = pairB->convert(valuesB, legB.getCurrency(), mBaseCurrency, ratesB);

    if (mDiagnostics)
      {
	*mDiagnostics << "PairAligner: " << legA.getSymbol() << "/" << legB.getSymbol()
		      << " aligned " << dateTimes.size() << " rows from "
		      << legA.getNumEntries() << " and " << legB.getNumEntries() << " input rows";
	if (numIncomplete > 0)
	  *mDiagnostics << ", dropped " << numIncomplete << " incomplete rows";
	*mDiagnostics << std::endl;
      }

    TimeIndex index = makeTimeIndex(std::move(dateTimes));
    return AlignedPair(legA.getSymbol(), legB.getSymbol(),
		       NumericSeries(index, std::move(valuesA)),
		       NumericSeries(index, std::move(valuesB)),
		       legA.getCurrency(), legB.getCurrency(), mBaseCurrency);
  }

  AlignedPair PairAligner::load(PriceSource& source,
				const std::string& tickerA,
				const std::string& tickerB,
				const DateRange& range,
				const BarInterval& interval,
				const FxTickerMap& fxTickers,
				PriceSource* fxSource) const
  {
    PriceSource& fxProvider = fxSource ? *fxSource : source;

    PriceSeries legA = source.fetch(tickerA, range, interval);
    PriceSeries legB = source.fetch(tickerB, range, interval);

    std::map<std::string, PriceSeries> fxCache;

    auto resolveFx = [&](const std::string& ticker, const PriceSeries& leg) -> boost::optional<PriceSeries>
      {
	if (!needsConversion(leg))
	  return boost::none;

	auto fxTickerIt = fxTickers.find(ticker);
	if (fxTickerIt == fxTickers.end() || fxTickerIt->second.empty())
	  return boost::none;

	const std::string& fxTicker = fxTickerIt->second;
	auto cached = fxCache.find(fxTicker);
	if (cached == fxCache.end())
	  cached = fxCache.emplace(fxTicker, fxProvider.fetch(fxTicker, range, interval)).first;

	return cached->second;
      };

    boost::optional<PriceSeries> fxA = resolveFx(tickerA, legA);
    boost::optional<PriceSeries> fxB = resolveFx(tickerB, legB);

    return align(legA, legB, fxA, fxB);
  }

  AlignedPair PairAligner::load(PriceSource& source,
				const std::string& tickerA,
				const std::string& tickerB,
				const DateRange& range,
				const BarInterval& interval,
				const std::string& fxTicker,
				PriceSource* fxSource) const
  {
    FxTickerMap fxTickers;
    if (!fxTicker.empty())
      {
	fxTickers[tickerA] = fxTicker;
	fxTickers[tickerB] = fxTicker;
      }

    return load(source, tickerA, tickerB, range, interval, fxTickers, fxSource);
  }
}
