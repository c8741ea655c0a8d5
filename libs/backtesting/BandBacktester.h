// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_BAND_BACKTESTER_H
#define __STATARB_BAND_BACKTESTER_H 1

#include <vector>
#include "BacktestStats.h"
#include "BollingerBands.h"
#include "NumericSeries.h"
#include "Trade.h"

namespace statarb
{
  class BacktestResult
  {
  public:
    BacktestResult(unsigned int window,
		   const BollingerBands& bands,
		   const std::vector<Trade>& trades,
		   const NumericSeries& equityCurve,
		   const BacktestStats& stats,
		   bool openPositionAtEnd)
      : mWindow(window),
	mBands(bands),
	mTrades(trades),
	mEquityCurve(equityCurve),
	mStats(stats),
	mOpenPositionAtEnd(openPositionAtEnd)
    {}

    unsigned int getWindow() const
    {
      return mWindow;
    }

    const BollingerBands& getBands() const
    {
      return mBands;
    }

    // Closed trades in the order they were exited
    const std::vector<Trade>& getTrades() const
    {
      return mTrades;
    }

    // Cumulative realized P&L at every bar of the spread
    const NumericSeries& getEquityCurve() const
    {
      return mEquityCurve;
    }

    const BacktestStats& getStats() const
    {
      return mStats;
    }

    // A position was still open on the last bar; it is not in getTrades()
    bool getOpenPositionAtEnd() const
    {
      return mOpenPositionAtEnd;
    }

  private:
    unsigned int mWindow;
    BollingerBands mBands;
    std::vector<Trade> mTrades;
    NumericSeries mEquityCurve;
    BacktestStats mStats;
    bool mOpenPositionAtEnd;
  };

  //
  // class BandBacktester
  //
  // Mean reversion on the spread holding at most one position. From flat it
  // buys the spread at or below the lower band and sells it at or above the
  // upper band. A long closes at or above the mean, a short at or below it.
  // Nothing happens while the bands are undefined. Each closed trade pays the
  // fee once.
  //
  class BandBacktester
  {
  public:
    explicit BandBacktester(double numStd, double fee = 0.0);

    double getNumStd() const
    {
      return mNumStd;
    }

    double getFee() const
    {
      return mFee;
    }

    // Computes bands for window and runs on them
    BacktestResult run(const NumericSeries& spread, unsigned int window) const;

    /**
     * @brief Runs on precomputed bands.
     *
     * @throws std::invalid_argument if bands and spread differ in length.
     */
    BacktestResult run(const NumericSeries& spread, const BollingerBands& bands) const;

  private:
    double mNumStd;
    double mFee;
  };
}

#endif
