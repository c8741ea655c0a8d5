#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "BacktestStats.h"
#include "TestUtils.h"

using namespace statarb;
using namespace Catch;

namespace
{
  Trade makeTrade(double pnl, std::size_t entryBar, std::size_t exitBar)
  {
    std::vector<boost::posix_time::ptime> dates = makeDailyDateTimes(exitBar + 1);
    return Trade(dates[entryBar], dates[exitBar], TradeSide::Long, 0.0, pnl, pnl, 0.0, entryBar, exitBar);
  }
}

TEST_CASE("BacktestStats default is all zeros", "[BacktestStats]")
{
    BacktestStats stats;
    REQUIRE(stats.getNumTrades() == 0);
    REQUIRE(stats.getWinRate() == 0.0);
    REQUIRE(stats.getSharpe() == 0.0);
    REQUIRE(stats.getMaxDrawdown() == 0.0);
    REQUIRE(BacktestStatsCalculator::compute(std::vector<double>{}, {}) == stats);
}

TEST_CASE("BacktestStatsCalculator winners and losers", "[BacktestStats]")
{
    std::vector<Trade> trades = {makeTrade(5.0, 0, 1), makeTrade(-2.0, 1, 4)};
    std::vector<double> equity = {0.0, 5.0, 3.0};

    BacktestStats stats = BacktestStatsCalculator::compute(equity, trades);

    REQUIRE(stats.getNumTrades() == 2);
    REQUIRE(stats.getNumWinners() == 1);
    REQUIRE(stats.getNumLosers() == 1);
    REQUIRE(stats.getWinRate() == Approx(0.5));
    REQUIRE(stats.getAverageWin() == Approx(5.0));
    REQUIRE(stats.getAverageLoss() == Approx(-2.0));
    REQUIRE(stats.getTotalPnl() == Approx(3.0));
    REQUIRE(stats.getProfitFactor() == Approx(2.5));
    REQUIRE(stats.getAverageBarsInTrade() == Approx(2.0));
    REQUIRE(stats.getMaxDrawdown() == Approx(-2.0));

    // changes 5 and -2: mean 1.5, population std 3.5
    REQUIRE(stats.getSharpe() == Approx(1.5 / 3.5));
}

TEST_CASE("BacktestStatsCalculator fallbacks", "[BacktestStats]")
{
    SECTION("Only winners has no profit factor or average loss")
    {
        BacktestStats stats = BacktestStatsCalculator::compute(std::vector<double>{0.0, 1.0, 2.0},
                                                               {makeTrade(1.0, 0, 1), makeTrade(1.0, 1, 2)});
        REQUIRE(stats.getAverageLoss() == 0.0);
        REQUIRE(stats.getProfitFactor() == 0.0);
        REQUIRE(stats.getWinRate() == 1.0);
        // Constant change has zero std
        REQUIRE(stats.getSharpe() == 0.0);
    }

    SECTION("Single point equity curve")
    {
        BacktestStats stats = BacktestStatsCalculator::compute(std::vector<double>{4.0}, {});
        REQUIRE(stats.getSharpe() == 0.0);
        REQUIRE(stats.getMaxDrawdown() == 0.0);
    }

    SECTION("Flat trade is neither a winner nor a loser")
    {
        BacktestStats stats = BacktestStatsCalculator::compute(std::vector<double>{0.0, 0.0}, {makeTrade(0.0, 0, 1)});
        REQUIRE(stats.getNumTrades() == 1);
        REQUIRE(stats.getNumWinners() == 0);
        REQUIRE(stats.getNumLosers() == 0);
        REQUIRE(stats.getWinRate() == 0.0);
    }

    SECTION("Drawdown is measured from the running peak")
    {
        BacktestStats stats = BacktestStatsCalculator::compute(std::vector<double>{0.0, 3.0, 1.0, 4.0, 0.5, 2.0}, {});
        REQUIRE(stats.getMaxDrawdown() == Approx(-3.5));
    }
}
