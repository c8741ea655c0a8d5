#include "PerformanceReporter.h"
#include <algorithm>
#include <boost/format.hpp>
#include "UtcTime.h"

namespace spreadrunner
{
namespace reporting
{

void PerformanceReporter::writeSectionHeader(std::ostream& os, const std::string& title)
{
    os << std::endl << "=== " << title << " ===" << std::endl;
}

void PerformanceReporter::writeAlignedHead(std::ostream& os, const AlignedPair& pair, std::size_t numRows)
{
    writeSectionHeader(os, "Aligned prices in " + pair.getBaseCurrency());
    os << pair.size() << " aligned rows" << std::endl;
    os << boost::format("%-22s %14s %14s\n") % "timestamp" % pair.getTickerA() % pair.getTickerB();

    const std::size_t rows = std::min(numRows, pair.size());
    for (std::size_t i = 0; i < rows; ++i)
        os << boost::format("%-22s %14.6f %14.6f\n")
            % toIsoUtcString(pair.getDateTimes()[i]) % pair.getValuesA()[i] % pair.getValuesB()[i];
}

void PerformanceReporter::writeHedgeRatio(std::ostream& os, const HedgeRatioResult& hedge)
{
    writeSectionHeader(os, "Hedge ratio");
    os << boost::format("Hedge ratio: %.6f\n") % hedge.getRatio();
    if (hedge.getFit().hasIntercept())
        os << boost::format("Intercept: %.6f\n") % hedge.getIntercept();
    os << hedge.getSummary() << std::endl;
}

void PerformanceReporter::writeStationarity(std::ostream& os, const AdfResult& adf, double significance)
{
    writeSectionHeader(os, "Augmented Dickey-Fuller test on the spread");
    os << boost::format("ADF statistic: %.4f\n") % adf.getStatistic();
    os << boost::format("p-value: %.4f\n") % adf.getPValue();
    os << "Lags used: " << adf.getUsedLag() << std::endl;
    os << "Observations: " << adf.getNumObservations() << std::endl;
    if (adf.getIcBest())
        os << boost::format("Best information criterion: %.4f\n") % *adf.getIcBest();

    os << "Critical values:" << std::endl;
    for (const char* level : {"1%", "5%", "10%"})
        os << boost::format("  %-4s %.4f\n") % level % adf.getCriticalValue(level);

    if (adf.getPValue() > significance)
        os << boost::format("Warning: p-value %.4f is above %.2f, spread may not be stationary\n")
            % adf.getPValue() % significance;
}

void PerformanceReporter::writeWindowSummary(std::ostream& os, const std::map<unsigned int, BacktestResult>& results)
{
    writeSectionHeader(os, "Backtest by window");
    os << boost::format("%8s %8s %8s %10s %10s %12s %10s %12s\n")
        % "window" % "trades" % "win %" % "avg win" % "avg loss" % "total pnl" % "sharpe" % "max dd";

    for (const auto& kv : results)
    {
        const BacktestStats& stats = kv.second.getStats();
        os << boost::format("%8d %8d %8.2f %10.4f %10.4f %12.4f %10.4f %12.4f%s\n")
            % kv.first % stats.getNumTrades() % (stats.getWinRate() * 100.0)
            % stats.getAverageWin() % stats.getAverageLoss() % stats.getTotalPnl()
            % stats.getSharpe() % stats.getMaxDrawdown()
            % (kv.second.getOpenPositionAtEnd() ? "  (open position at end)" : "");
    }
}

void PerformanceReporter::writeTradeList(std::ostream& os, const BacktestResult& result)
{
    writeSectionHeader(os, "Trades for window " + std::to_string(result.getWindow()));
    if (result.getTrades().empty())
    {
        os << "No closed trades" << std::endl;
        return;
    }

    os << boost::format("%-6s %-22s %-22s %12s %12s %12s\n")
        % "side" % "entry" % "exit" % "entry spread" % "exit spread" % "pnl";

    for (const Trade& trade : result.getTrades())
        os << boost::format("%-6s %-22s %-22s %12.6f %12.6f %12.6f\n")
            % toString(trade.getSide())
            % toIsoUtcString(trade.getEntryDateTime())
            % toIsoUtcString(trade.getExitDateTime())
            % trade.getEntrySpread() % trade.getExitSpread() % trade.getPnl();
}

boost::optional<unsigned int>
PerformanceReporter::getBestWindow(const std::map<unsigned int, BacktestResult>& results)
{
    boost::optional<unsigned int> best;
    double bestPnl = 0.0;

    for (const auto& kv : results)
    {
        const double pnl = kv.second.getStats().getTotalPnl();
        if (!best || pnl > bestPnl)
        {
            best = kv.first;
            bestPnl = pnl;
        }
    }

    return best;
}

} // namespace reporting
} // namespace spreadrunner
