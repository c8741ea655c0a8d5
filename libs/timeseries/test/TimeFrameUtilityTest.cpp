#include <catch2/catch_test_macros.hpp>
#include "TimeFrameUtility.h"
#include "StatArbException.h"

using namespace statarb;
using boost::posix_time::minutes;
using boost::posix_time::hours;

TEST_CASE("getBarIntervalFromString: minute and hour intervals", "[BarInterval]") {
    BarInterval fiveMin = getBarIntervalFromString("5m");
    REQUIRE(fiveMin.getTimeFrame() == TimeFrame::INTRADAY);
    REQUIRE(fiveMin.getBarLength() == minutes(5));
    REQUIRE(fiveMin.getBarLengthInMinutes() == 5);
    REQUIRE(fiveMin.toString() == "5m");

    BarInterval fifteen = getBarIntervalFromString("15min");
    REQUIRE(fifteen.toString() == "15m");
    REQUIRE(fifteen.getBarLengthInMinutes() == 15);

    BarInterval fourHour = getBarIntervalFromString(" 4H ");
    REQUIRE(fourHour.getTimeFrame() == TimeFrame::INTRADAY);
    REQUIRE(fourHour.getBarLength() == hours(4));
    REQUIRE(fourHour.toString() == "4h");
}

TEST_CASE("getBarIntervalFromString: daily and weekly intervals", "[BarInterval]") {
    BarInterval daily = getBarIntervalFromString("1d");
    REQUIRE(daily.getTimeFrame() == TimeFrame::DAILY);
    REQUIRE(daily.getBarLength() == hours(24));
    REQUIRE(daily.toString() == "1d");
    REQUIRE(getBarIntervalFromString("Daily") == daily);

    BarInterval weekly = getBarIntervalFromString("1wk");
    REQUIRE(weekly.getTimeFrame() == TimeFrame::WEEKLY);
    REQUIRE(weekly.toString() == "1w");
    REQUIRE(getBarIntervalFromString("weekly") == weekly);

    REQUIRE(getBarIntervalFromString("hourly") == getBarIntervalFromString("1h"));
}

TEST_CASE("getBarIntervalFromString: unsupported intervals throw", "[BarInterval]") {
    REQUIRE_THROWS_AS(getBarIntervalFromString(""), ConfigurationException);
    REQUIRE_THROWS_AS(getBarIntervalFromString("   "), ConfigurationException);
    REQUIRE_THROWS_AS(getBarIntervalFromString("m"), ConfigurationException);
    REQUIRE_THROWS_AS(getBarIntervalFromString("15"), ConfigurationException);
    REQUIRE_THROWS_AS(getBarIntervalFromString("0m"), ConfigurationException);
    REQUIRE_THROWS_AS(getBarIntervalFromString("2d"), ConfigurationException);
    REQUIRE_THROWS_AS(getBarIntervalFromString("3mo"), ConfigurationException);
    REQUIRE_THROWS_AS(getBarIntervalFromString("tick"), ConfigurationException);
}
