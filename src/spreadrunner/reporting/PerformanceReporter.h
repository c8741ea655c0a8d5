#pragma once

#include <map>
#include <ostream>
#include <string>
#include <boost/optional.hpp>
#include "AlignedPair.h"
#include "BandBacktester.h"
#include "HedgeEstimator.h"
#include "StationarityTester.h"

namespace spreadrunner
{
namespace reporting
{

using namespace statarb;

/**
 * @brief Console report of a pair study
 *
 * Writes the aligned data, the hedge regression, the stationarity test and
 * the per window backtest results in the order the driver produces them.
 */
class PerformanceReporter
{
public:
    /**
     * @brief Write the first rows of the aligned legs
     * @param os Output stream
     * @param pair Aligned pair
     * @param numRows Number of rows to show
     */
    static void writeAlignedHead(std::ostream& os, const AlignedPair& pair, std::size_t numRows = 5);

    static void writeHedgeRatio(std::ostream& os, const HedgeRatioResult& hedge);

    /**
     * @brief Write the ADF result and its critical values
     *
     * A warning line is added when the p-value is above significance.
     */
    static void writeStationarity(std::ostream& os, const AdfResult& adf, double significance = 0.05);

    static void writeWindowSummary(std::ostream& os, const std::map<unsigned int, BacktestResult>& results);

    static void writeTradeList(std::ostream& os, const BacktestResult& result);

    /**
     * @brief Window with the highest total P&L
     * @return The window, the smallest one on ties, or none if results is empty
     */
    static boost::optional<unsigned int>
    getBestWindow(const std::map<unsigned int, BacktestResult>& results);

private:
    static void writeSectionHeader(std::ostream& os, const std::string& title);
};

} // namespace reporting
} // namespace spreadrunner
