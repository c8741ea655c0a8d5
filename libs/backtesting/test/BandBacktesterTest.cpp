#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include "BandBacktester.h"
#include "StatArbException.h"
#include "TestUtils.h"

using namespace statarb;
using namespace Catch;

namespace
{
  NumericSeries makeReversionSpread()
  {
    return makeDailySeries({10.0, 9.0, 8.0, 7.0, 9.0, 11.0, 10.0});
  }
}

TEST_CASE("BandBacktester long then short round trips", "[BandBacktester]")
{
    NumericSeries spread = makeReversionSpread();
    BacktestResult result = BandBacktester(1.0).run(spread, 3);

    REQUIRE(result.getWindow() == 3);
    REQUIRE_FALSE(result.getOpenPositionAtEnd());

    const std::vector<Trade>& trades = result.getTrades();
    REQUIRE(trades.size() == 2);

    REQUIRE(trades[0].getSide() == TradeSide::Long);
    REQUIRE(trades[0].getEntryBar() == 2);
    REQUIRE(trades[0].getExitBar() == 4);
    REQUIRE(trades[0].getEntrySpread() == 8.0);
    REQUIRE(trades[0].getExitSpread() == 9.0);
    REQUIRE(trades[0].getPnl() == Approx(1.0));
    REQUIRE(trades[0].getEntryDateTime() == spread.getDateTime(2));
    REQUIRE(trades[0].getExitDateTime() == spread.getDateTime(4));

    // Exit at exactly the mean
    REQUIRE(trades[1].getSide() == TradeSide::Short);
    REQUIRE(trades[1].getEntryBar() == 5);
    REQUIRE(trades[1].getExitBar() == 6);
    REQUIRE(trades[1].getPnl() == Approx(1.0));

    const std::vector<double> expectedEquity = {0.0, 0.0, 0.0, 0.0, 1.0, 1.0, 2.0};
    REQUIRE(result.getEquityCurve().size() == expectedEquity.size());
    for (std::size_t i = 0; i < expectedEquity.size(); ++i)
        REQUIRE(result.getEquityCurve().getValue(i) == Approx(expectedEquity[i]));
    REQUIRE(result.getEquityCurve().getDateTimes() == spread.getDateTimes());

    const BacktestStats& stats = result.getStats();
    REQUIRE(stats.getNumTrades() == 2);
    REQUIRE(stats.getWinRate() == 1.0);
    REQUIRE(stats.getTotalPnl() == Approx(2.0));
    REQUIRE(stats.getMaxDrawdown() == 0.0);
    REQUIRE(stats.getSharpe() == Approx(1.0 / std::sqrt(2.0)));
    REQUIRE(stats.getAverageBarsInTrade() == Approx(1.5));
}

TEST_CASE("BandBacktester charges the fee once per trade", "[BandBacktester]")
{
    BacktestResult result = BandBacktester(1.0, 0.25).run(makeReversionSpread(), 3);

    REQUIRE(result.getTrades().size() == 2);
    REQUIRE(result.getTrades()[0].getPnl() == Approx(0.75));
    REQUIRE(result.getTrades()[0].getFee() == 0.25);
    REQUIRE(result.getEquityCurve().getValue(6) == Approx(1.5));
    REQUIRE(result.getStats().getTotalPnl() == Approx(1.5));
}

TEST_CASE("BandBacktester edge cases", "[BandBacktester]")
{
    SECTION("Zero width bands open on the first defined bar and never close")
    {
        BacktestResult result = BandBacktester(0.0).run(makeDailySeries({1.0, 2.0, 3.0, 4.0, 5.0}), 2);
        REQUIRE(result.getTrades().empty());
        REQUIRE(result.getOpenPositionAtEnd());
        for (double value : result.getEquityCurve().getValues())
            REQUIRE(value == 0.0);
    }

    SECTION("Window longer than the series never trades")
    {
        BacktestResult result = BandBacktester(2.0).run(makeReversionSpread(), 50);
        REQUIRE(result.getTrades().empty());
        REQUIRE_FALSE(result.getOpenPositionAtEnd());
        REQUIRE(result.getEquityCurve().size() == 7);
        REQUIRE(result.getStats().getNumTrades() == 0);
        REQUIRE(result.getStats().getSharpe() == 0.0);
    }

    SECTION("Empty spread")
    {
        BacktestResult result = BandBacktester(2.0).run(makeDailySeries({}), 5);
        REQUIRE(result.getTrades().empty());
        REQUIRE(result.getEquityCurve().empty());
        REQUIRE(result.getStats() == BacktestStats());
    }

    SECTION("Bands of another length are rejected")
    {
        BollingerBands bands = BandSignalGenerator(1.0).compute(makeDailySeries({1.0, 2.0, 3.0}), 2);
        REQUIRE_THROWS_AS(BandBacktester(1.0).run(makeReversionSpread(), bands), std::invalid_argument);
    }

    SECTION("Invalid parameters")
    {
        REQUIRE_THROWS_AS(BandBacktester(1.0).run(makeReversionSpread(), 0), ConfigurationException);
        REQUIRE_THROWS_AS(BandBacktester(1.0, std::nan("")), ConfigurationException);
    }
}

TEST_CASE("BandBacktester invariants on a mean reverting series", "[BandBacktester]")
{
    NumericSeries spread = makeDailySeries(makeAutoregressiveSeries(42, 400, 0.8));
    BacktestResult result = BandBacktester(1.0, 0.01).run(spread, 20);

    const std::vector<Trade>& trades = result.getTrades();
    REQUIRE_FALSE(trades.empty());
    REQUIRE(result.getEquityCurve().size() == spread.size());

    // Equity only moves on exit bars
    for (std::size_t i = 0; i < 20 - 1; ++i)
        REQUIRE(result.getEquityCurve().getValue(i) == 0.0);

    for (std::size_t k = 0; k < trades.size(); ++k)
    {
        REQUIRE(trades[k].getEntryBar() >= 19);
        REQUIRE(trades[k].getExitBar() > trades[k].getEntryBar());
        if (k > 0)
            REQUIRE(trades[k].getEntryBar() > trades[k - 1].getExitBar());

        const double gross = trades[k].isLong()
            ? trades[k].getExitSpread() - trades[k].getEntrySpread()
            : trades[k].getEntrySpread() - trades[k].getExitSpread();
        REQUIRE(trades[k].getPnl() == Approx(gross - 0.01));
    }

    double total = 0.0;
    for (const Trade& trade : trades)
        total += trade.getPnl();

    REQUIRE(result.getStats().getTotalPnl() == Approx(total));
    if (!result.getOpenPositionAtEnd())
        REQUIRE(result.getEquityCurve().getValue(spread.size() - 1) == Approx(total));
}
