// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include <stdexcept>
#include <string>
#include "BandBacktester.h"
#include "StatArbException.h"

namespace statarb
{
  namespace
  {
    enum class PositionState {Flat, Long, Short};
  }

  BandBacktester::BandBacktester(double numStd, double fee)
    : mNumStd(numStd),
      mFee(fee)
  {
    if (!std::isfinite(numStd))
      throw ConfigurationException("BandBacktester: number of standard deviations must be finite");

    if (!std::isfinite(fee))
      throw ConfigurationException("BandBacktester: fee must be finite");
  }

  BacktestResult BandBacktester::run(const NumericSeries& spread, unsigned int window) const
  {
    BandSignalGenerator generator(mNumStd);
    return run(spread, generator.compute(spread, window));
  }

  BacktestResult BandBacktester::run(const NumericSeries& spread, const BollingerBands& bands) const
  {
    if (bands.size() != spread.size())
      throw std::invalid_argument("BandBacktester::run - bands for window "
				  + std::to_string(bands.getWindow()) + " have "
				  + std::to_string(bands.size()) + " points but spread has "
				  + std::to_string(spread.size()));

    const std::vector<double>& values = spread.getValues();
    const OptionalSeries& mean = bands.getMean();
    const OptionalSeries& upper = bands.getUpper();
    const OptionalSeries& lower = bands.getLower();

    std::vector<Trade> trades;
    std::vector<double> equity;
    equity.reserve(values.size());

    PositionState state = PositionState::Flat;
    double cumulativePnl = 0.0;
    double entrySpread = 0.0;
    std::size_t entryBar = 0;

    for (std::size_t i = 0; i < values.size(); ++i)
      {
	if (!bands.isDefined(i))
	  {
	    equity.push_back(cumulativePnl);
	    continue;
	  }

	const double value = values[i];

	if (state == PositionState::Flat)
	  {
	    if (value <= *lower.getValue(i))
	      {
		state = PositionState::Long;
		entrySpread = value;
		entryBar = i;
	      }
	    else if (value >= *upper.getValue(i))
	      {
		state = PositionState::Short;
		entrySpread = value;
		entryBar = i;
	      }
	  }
	else if (state == PositionState::Long)
	  {
	    if (value >= *mean.getValue(i))
	      {
		const double pnl = value - entrySpread - mFee;
		cumulativePnl += pnl;
		trades.emplace_back(spread.getDateTime(entryBar), spread.getDateTime(i), TradeSide::Long,
				    entrySpread, value, pnl, mFee, entryBar, i);
		state = PositionState::Flat;
	      }
	  }
	else
	  {
	    if (value <= *mean.getValue(i))
	      {
		const double pnl = entrySpread - value - mFee;
		cumulativePnl += pnl;
		trades.emplace_back(spread.getDateTime(entryBar), spread.getDateTime(i), TradeSide::Short,
				    entrySpread, value, pnl, mFee, entryBar, i);
		state = PositionState::Flat;
	      }
	  }

	equity.push_back(cumulativePnl);
      }

    NumericSeries equityCurve(spread.getTimeIndex(), equity);
    BacktestStats stats = BacktestStatsCalculator::compute(equity, trades);

    return BacktestResult(bands.getWindow(), bands, trades, equityCurve, stats,
			  state != PositionState::Flat);
  }
}
