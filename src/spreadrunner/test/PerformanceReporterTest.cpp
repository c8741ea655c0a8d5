#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <boost/optional/optional_io.hpp>
#include "MultiWindowRunner.h"
#include "reporting/PerformanceReporter.h"
#include "utils/OutputUtils.h"
#include "TestUtils.h"

using namespace statarb;
using spreadrunner::reporting::PerformanceReporter;
using spreadrunner::utils::TeeStream;

TEST_CASE("PerformanceReporter picks the window with the highest pnl", "[PerformanceReporter]")
{
    NumericSeries spread = makeDailySeries({10.0, 9.0, 8.0, 7.0, 9.0, 11.0, 10.0});
    MultiWindowRunner runner(1.0);

    auto results = runner.run(spread, {3, 50});
    REQUIRE(PerformanceReporter::getBestWindow(results) == boost::optional<unsigned int>(3));

    // Ties go to the smaller window
    auto idle = runner.run(spread, {40, 50});
    REQUIRE(PerformanceReporter::getBestWindow(idle) == boost::optional<unsigned int>(40));

    REQUIRE_FALSE(PerformanceReporter::getBestWindow({}));

    std::ostringstream os;
    PerformanceReporter::writeWindowSummary(os, results);
    PerformanceReporter::writeTradeList(os, results.at(3));
    REQUIRE(os.str().find("Backtest by window") != std::string::npos);
    REQUIRE(os.str().find("short") != std::string::npos);

    std::ostringstream none;
    PerformanceReporter::writeTradeList(none, results.at(50));
    REQUIRE(none.str().find("No closed trades") != std::string::npos);
}

TEST_CASE("TeeStream writes to both streams", "[OutputUtils]")
{
    std::ostringstream first, second;
    TeeStream tee(first, second);
    tee << "spread " << 42 << std::endl;

    REQUIRE(first.str() == "spread 42\n");
    REQUIRE(second.str() == "spread 42\n");
}
