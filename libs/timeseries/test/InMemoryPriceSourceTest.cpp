#include <catch2/catch_test_macros.hpp>
#include "InMemoryPriceSource.h"
#include "TimeFrameUtility.h"

using namespace statarb;
using boost::gregorian::date;
using boost::posix_time::ptime;

namespace
{
  PriceSeries makeDailySeries(const std::string& symbol, const std::string& currency, int days)
  {
    PriceSeries series(symbol, currency);
    for (int day = 1; day <= days; ++day)
      series.addEntry(ptime(date(2024, 1, day)), 10.0 * day);

    return series;
  }
}

TEST_CASE("InMemoryPriceSource returns the requested range", "[InMemoryPriceSource]")
{
    InMemoryPriceSource source;
    source.addSeries(makeDailySeries("AAA", "USD", 20));

    BarInterval daily = getBarIntervalFromString("1d");
    PriceSeries result = source.fetch("AAA", DateRange(date(2024, 1, 5), date(2024, 1, 9)), daily);

    REQUIRE(result.getNumEntries() == 5);
    REQUIRE(result.getCurrency() == "USD");
    REQUIRE(source.getFetchCount("AAA") == 1);
    REQUIRE(source.getFetchCount("BBB") == 0);
}

TEST_CASE("InMemoryPriceSource error cases", "[InMemoryPriceSource]")
{
    InMemoryPriceSource source;
    source.addSeries(makeDailySeries("AAA", "USD", 5));
    BarInterval daily = getBarIntervalFromString("1d");

    REQUIRE_THROWS_AS(source.fetch("ZZZ", DateRange(date(2024, 1, 1), date(2024, 1, 5)), daily),
                      PriceDataNotFoundException);
    REQUIRE_THROWS_AS(source.fetch("AAA", DateRange(date(2025, 1, 1), date(2025, 1, 5)), daily),
                      PriceRangeException);
    REQUIRE_THROWS_AS(source.addSeries(makeDailySeries("AAA", "USD", 3)), ConfigurationException);

    // Failed fetches are still counted
    REQUIRE(source.getFetchCount("AAA") == 1);
    REQUIRE(source.getTotalFetchCount() == 2);
}
