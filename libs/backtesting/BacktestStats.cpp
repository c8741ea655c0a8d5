// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cmath>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/sum.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include "BacktestStats.h"

namespace statarb
{
  using boost::accumulators::accumulator_set;
  using boost::accumulators::stats;
  using boost::accumulators::count;
  using boost::accumulators::mean;
  using boost::accumulators::sum;
  using boost::accumulators::variance;

  typedef boost::accumulators::tag::count count_tag;
  typedef boost::accumulators::tag::mean mean_tag;
  typedef boost::accumulators::tag::sum sum_tag;
  typedef boost::accumulators::tag::variance variance_tag;

  BacktestStats BacktestStatsCalculator::compute(const std::vector<double>& equity,
						 const std::vector<Trade>& trades)
  {
    accumulator_set<double, stats<count_tag, mean_tag, sum_tag>> winnersStats;
    accumulator_set<double, stats<count_tag, mean_tag, sum_tag>> losersStats;
    accumulator_set<double, stats<mean_tag>> barsInTradeStats;
    double totalPnl = 0.0;

    for (const Trade& trade : trades)
      {
	totalPnl += trade.getPnl();
	barsInTradeStats(static_cast<double>(trade.getNumBarsHeld()));

	// A flat trade counts as neither a winner nor a loser
	if (trade.getPnl() > 0.0)
	  winnersStats(trade.getPnl());
	else if (trade.getPnl() < 0.0)
	  losersStats(trade.getPnl());
      }

    const unsigned int numTrades = static_cast<unsigned int>(trades.size());
    const unsigned int numWinners = static_cast<unsigned int>(count(winnersStats));
    const unsigned int numLosers = static_cast<unsigned int>(count(losersStats));

    const double winRate = numTrades ? static_cast<double>(numWinners) / numTrades : 0.0;
    const double averageWin = numWinners ? mean(winnersStats) : 0.0;
    const double averageLoss = numLosers ? mean(losersStats) : 0.0;
    const double profitFactor = numLosers ? sum(winnersStats) / std::fabs(sum(losersStats)) : 0.0;
    const double averageBarsInTrade = numTrades ? mean(barsInTradeStats) : 0.0;

    accumulator_set<double, stats<mean_tag, variance_tag>> changeStats;
    for (std::size_t i = 1; i < equity.size(); ++i)
      changeStats(equity[i] - equity[i - 1]);

    double sharpe = 0.0;
    if (equity.size() > 1)
      {
	const double stdDev = std::sqrt(variance(changeStats));
	if (stdDev != 0.0)
	  sharpe = mean(changeStats) / stdDev;
      }

    double maxDrawdown = 0.0;
    if (!equity.empty())
      {
	double runningMax = equity.front();
	for (double value : equity)
	  {
	    runningMax = std::max(runningMax, value);
	    maxDrawdown = std::min(maxDrawdown, value - runningMax);
	  }
      }

    return BacktestStats(numTrades, numWinners, numLosers, winRate, averageWin, averageLoss,
			 totalPnl, sharpe, maxDrawdown, profitFactor, averageBarsInTrade);
  }
}
