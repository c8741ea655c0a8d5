// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_BACKTEST_STATS_H
#define __STATARB_BACKTEST_STATS_H 1

#include <vector>
#include "NumericSeries.h"
#include "Trade.h"

namespace statarb
{
  class BacktestStats
  {
  public:
    BacktestStats()
      : BacktestStats(0, 0, 0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0)
    {}

    BacktestStats(unsigned int numTrades,
		  unsigned int numWinners,
		  unsigned int numLosers,
		  double winRate,
		  double averageWin,
		  double averageLoss,
		  double totalPnl,
		  double sharpe,
		  double maxDrawdown,
		  double profitFactor,
		  double averageBarsInTrade)
      : mNumTrades(numTrades),
	mNumWinners(numWinners),
	mNumLosers(numLosers),
	mWinRate(winRate),
	mAverageWin(averageWin),
	mAverageLoss(averageLoss),
	mTotalPnl(totalPnl),
	mSharpe(sharpe),
	mMaxDrawdown(maxDrawdown),
	mProfitFactor(profitFactor),
	mAverageBarsInTrade(averageBarsInTrade)
    {}

    unsigned int getNumTrades() const
    {
      return mNumTrades;
    }

    unsigned int getNumWinners() const
    {
      return mNumWinners;
    }

    unsigned int getNumLosers() const
    {
      return mNumLosers;
    }

    // Fraction of trades with positive P&L
    double getWinRate() const
    {
      return mWinRate;
    }

    double getAverageWin() const
    {
      return mAverageWin;
    }

    // Negative when there are losing trades
    double getAverageLoss() const
    {
      return mAverageLoss;
    }

    double getTotalPnl() const
    {
      return mTotalPnl;
    }

    // Per bar, not annualized
    double getSharpe() const
    {
      return mSharpe;
    }

    // Zero or negative
    double getMaxDrawdown() const
    {
      return mMaxDrawdown;
    }

    double getProfitFactor() const
    {
      return mProfitFactor;
    }

    double getAverageBarsInTrade() const
    {
      return mAverageBarsInTrade;
    }

  private:
    unsigned int mNumTrades;
    unsigned int mNumWinners;
    unsigned int mNumLosers;
    double mWinRate;
    double mAverageWin;
    double mAverageLoss;
    double mTotalPnl;
    double mSharpe;
    double mMaxDrawdown;
    double mProfitFactor;
    double mAverageBarsInTrade;
  };

  inline bool operator==(const BacktestStats& lhs, const BacktestStats& rhs)
  {
    return lhs.getNumTrades() == rhs.getNumTrades() &&
      lhs.getNumWinners() == rhs.getNumWinners() &&
      lhs.getNumLosers() == rhs.getNumLosers() &&
      lhs.getWinRate() == rhs.getWinRate() &&
      lhs.getAverageWin() == rhs.getAverageWin() &&
      lhs.getAverageLoss() == rhs.getAverageLoss() &&
      lhs.getTotalPnl() == rhs.getTotalPnl() &&
      lhs.getSharpe() == rhs.getSharpe() &&
      lhs.getMaxDrawdown() == rhs.getMaxDrawdown() &&
      lhs.getProfitFactor() == rhs.getProfitFactor() &&
      lhs.getAverageBarsInTrade() == rhs.getAverageBarsInTrade();
  }

  class BacktestStatsCalculator
  {
  public:
    /**
     * @brief Summarizes a run from its equity curve and closed trades.
     *
     * Sharpe is the mean over the population standard deviation of the bar
     * to bar equity changes, and 0 when there are no changes or they do not
     * vary. Max drawdown is the lowest equity relative to its running peak.
     */
    static BacktestStats compute(const std::vector<double>& equity, const std::vector<Trade>& trades);

    static BacktestStats compute(const NumericSeries& equity, const std::vector<Trade>& trades)
    {
      return compute(equity.getValues(), trades);
    }
  };
}

#endif
