#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include "MultiWindowRunner.h"
#include "ParallelExecutors.h"
#include "StatArbException.h"
#include "TestUtils.h"

using namespace statarb;

TEST_CASE("MultiWindowRunner runs each distinct window", "[MultiWindowRunner]")
{
    NumericSeries spread = makeDailySeries(makeAutoregressiveSeries(3, 300, 0.9));
    std::ostringstream diagnostics;
    MultiWindowRunner runner(1.5, 0.0, nullptr, &diagnostics);

    auto results = runner.run(spread, {20, 5, 20, 60});

    REQUIRE(results.size() == 3);
    REQUIRE(results.count(5) == 1);
    REQUIRE(results.count(20) == 1);
    REQUIRE(results.count(60) == 1);
    REQUIRE(results.at(60).getWindow() == 60);
    REQUIRE(diagnostics.str().find("window 20") != std::string::npos);

    BacktestResult direct = BandBacktester(1.5).run(spread, 20);
    REQUIRE(results.at(20).getTrades() == direct.getTrades());
    REQUIRE(results.at(20).getStats() == direct.getStats());
}

TEST_CASE("MultiWindowRunner is independent of the executor", "[MultiWindowRunner]")
{
    NumericSeries spread = makeDailySeries(makeAutoregressiveSeries(99, 500, 0.85));
    const std::vector<unsigned int> windows = {5, 10, 15, 20, 30, 45, 60, 90};

    MultiWindowRunner serial(2.0, 0.05, std::make_shared<concurrency::SingleThreadExecutor>());
    MultiWindowRunner pooled(2.0, 0.05, std::make_shared<concurrency::ThreadPoolExecutor>(4));

    auto serialResults = serial.run(spread, windows);
    auto pooledResults = pooled.run(spread, windows);

    REQUIRE(serialResults.size() == windows.size());
    REQUIRE(pooledResults.size() == windows.size());
    for (unsigned int window : windows)
    {
        REQUIRE(serialResults.at(window).getTrades() == pooledResults.at(window).getTrades());
        REQUIRE(serialResults.at(window).getStats() == pooledResults.at(window).getStats());
        REQUIRE(serialResults.at(window).getEquityCurve().getValues()
                == pooledResults.at(window).getEquityCurve().getValues());
    }

    // Same call twice gives the same answer
    auto again = pooled.run(spread, windows);
    REQUIRE(again.at(45).getStats() == pooledResults.at(45).getStats());
}

TEST_CASE("MultiWindowRunner argument handling", "[MultiWindowRunner]")
{
    NumericSeries spread = makeDailySeries({1.0, 2.0, 3.0});
    MultiWindowRunner runner(1.0, 0.0, std::make_shared<concurrency::ThreadPoolExecutor>(2));

    REQUIRE(runner.run(spread, {}).empty());
    REQUIRE_THROWS_AS(runner.run(spread, {2, 0}), ConfigurationException);
    REQUIRE(runner.getBacktester().getNumStd() == 1.0);
}
