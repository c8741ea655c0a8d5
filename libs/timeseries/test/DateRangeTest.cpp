#include <catch2/catch_test_macros.hpp>
#include "DateRange.h"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

using namespace statarb;
using boost::gregorian::date;
using boost::posix_time::ptime;
using boost::posix_time::hours;
using boost::posix_time::time_from_string;

TEST_CASE("DateRange: valid construction and getters", "[DateRange]") {
    date d1(2020, 1, 1);
    date d2(2020, 12, 31);
    DateRange range(d1, d2);
    REQUIRE(range.getFirstDate() == d1);
    REQUIRE(range.getLastDate() == d2);
    REQUIRE(range.getFirstDateTime() == ptime(d1));
    REQUIRE(range.getLastDateTime() == ptime(d2));
}

TEST_CASE("DateRange: start not before end throws", "[DateRange]") {
    date d1(2020, 12, 31);
    date d2(2020, 1, 1);
    REQUIRE_THROWS_AS(DateRange(d1, d2), PriceRangeException);
    REQUIRE_THROWS_AS(DateRange(d1, d1), PriceRangeException);

    ptime t(date(2021, 3, 1), hours(10));
    REQUIRE_THROWS_AS(DateRange(t, t), PriceRangeException);
    REQUIRE_THROWS_AS(DateRange(ptime(boost::posix_time::not_a_date_time), t), PriceRangeException);
}

TEST_CASE("DateRange: range errors are price source errors", "[DateRange]") {
    date d1(2020, 12, 31);
    REQUIRE_THROWS_AS(DateRange(d1, d1), PriceSourceException);
    REQUIRE_THROWS_AS(DateRange(d1, d1), StatArbException);
}

TEST_CASE("DateRange: contains is inclusive at both ends", "[DateRange]") {
    ptime first = time_from_string("2022-05-02 09:30:00");
    ptime last = time_from_string("2022-05-02 16:00:00");
    DateRange range(first, last);

    REQUIRE(range.contains(first));
    REQUIRE(range.contains(last));
    REQUIRE(range.contains(time_from_string("2022-05-02 12:00:00")));
    REQUIRE_FALSE(range.contains(time_from_string("2022-05-02 09:29:59")));
    REQUIRE_FALSE(range.contains(time_from_string("2022-05-02 16:00:01")));
}

TEST_CASE("DateRange: equality and copy", "[DateRange]") {
    date d1(2021, 7, 1);
    date d2(2021, 7, 31);
    DateRange a(d1, d2);
    DateRange b(d1, d2);
    DateRange c(d1, date(2021, 8, 1));
    REQUIRE(a == b);
    REQUIRE(!(a != b));
    REQUIRE(a != c);

    DateRange copy(a);
    REQUIRE(copy == a);
    copy = c;
    REQUIRE(copy == c);
}
