#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <deque>
#include <sstream>
#include "OandaPriceSource.h"
#include "StatArbException.h"
#include "TimeFrameUtility.h"
#include "UtcTime.h"

using namespace statarb;
using namespace Catch;
using boost::posix_time::ptime;
using boost::posix_time::minutes;
using boost::posix_time::time_from_string;

namespace
{
  // Serves canned response bodies in order and records the requests
  class CannedOandaPriceSource : public OandaPriceSource
  {
  public:
    CannedOandaPriceSource()
      : OandaPriceSource("token")
    {}

    void addResponse(const std::string& body)
    {
      mResponses.push_back(body);
    }

    const std::vector<std::string>& getRequests() const
    {
      return mRequests;
    }

  protected:
    std::string httpGet(const std::string& uri) const override
    {
      mRequests.push_back(uri);
      if (mResponses.empty())
        return "{\"candles\":[]}";

      std::string body = mResponses.front();
      mResponses.pop_front();
      return body;
    }

  private:
    mutable std::deque<std::string> mResponses;
    mutable std::vector<std::string> mRequests;
  };

  std::string makeCandle(const ptime& time, double close, bool complete = true)
  {
    std::ostringstream os;
    os << "{\"complete\":" << (complete ? "true" : "false")
       << ",\"time\":\"" << toIsoUtcString(time) << "\""
       << ",\"mid\":{\"o\":\"1.0\",\"c\":\"" << close << "\"}}";
    return os.str();
  }

  std::string makeCandles(const ptime& start, std::size_t count, const minutes& step)
  {
    std::ostringstream os;
    os << "{\"instrument\":\"EUR_USD\",\"candles\":[";
    for (std::size_t i = 0; i < count; ++i)
      {
        if (i)
          os << ",";
        os << makeCandle(start + step * static_cast<int>(i), 1.0 + 0.0001 * (i % 100));
      }
    os << "]}";
    return os.str();
  }
}

TEST_CASE("OandaPriceSource granularity mapping", "[OandaPriceSource]")
{
    REQUIRE(OandaPriceSource::getGranularity("1m") == "M1");
    REQUIRE(OandaPriceSource::getGranularity("15m") == "M15");
    REQUIRE(OandaPriceSource::getGranularity("4h") == "H4");
    REQUIRE(OandaPriceSource::getGranularity("1D") == "D");
    REQUIRE(OandaPriceSource::getGranularity("1w") == "W");
    REQUIRE(OandaPriceSource::getGranularity("h1") == "H1");
    REQUIRE(OandaPriceSource::getGranularity("M30") == "M30");
    REQUIRE_THROWS_AS(OandaPriceSource::getGranularity("2h"), ConfigurationException);
    REQUIRE_THROWS_AS(OandaPriceSource::getGranularity(""), ConfigurationException);

    REQUIRE(OandaPriceSource::getGranularityLength("H4") == boost::posix_time::hours(4));
    REQUIRE(OandaPriceSource::getGranularityLength("W") == boost::posix_time::hours(168));
}

TEST_CASE("OandaPriceSource configuration", "[OandaPriceSource]")
{
    OandaPriceSource practice("token");
    REQUIRE(practice.getBaseUrl() == OandaPriceSource::PracticeUrl);
    REQUIRE(OandaPriceSource("token", "LIVE").getBaseUrl() == OandaPriceSource::LiveUrl);
    REQUIRE(OandaPriceSource("token", "fxtrade").getBaseUrl() == OandaPriceSource::LiveUrl);

    REQUIRE_THROWS_AS(OandaPriceSource("token", "demo"), ConfigurationException);
    REQUIRE_THROWS_AS(OandaPriceSource(""), ConfigurationException);

    REQUIRE(practice.getInstrumentCurrency("EUR_USD") == "USD");
    REQUIRE(practice.getInstrumentCurrency("DE30_EUR") == "EUR");
    REQUIRE(practice.getInstrumentCurrency("SPX500") == "USD");

    OandaPriceSource overridden("token", "practice", {{"EUR_USD", "gbp"}});
    REQUIRE(overridden.getInstrumentCurrency("EUR_USD") == "GBP");

    const std::string uri = practice.buildCandlesUri("EUR_USD", "H1", time_from_string("2024-03-01 12:00:00"));
    REQUIRE(uri == "https://api-fxpractice.oanda.com/v3/instruments/EUR_USD/candles"
                   "?price=M&granularity=H1&from=2024-03-01T12:00:00Z&count=5000");
}

TEST_CASE("OandaPriceSource parses candles", "[OandaPriceSource]")
{
    const ptime t0 = time_from_string("2024-01-01 00:00:00");

    SECTION("Incomplete candles are skipped")
    {
        std::string body = "{\"candles\":[" + makeCandle(t0, 1.1) + ","
          + makeCandle(t0 + minutes(1), 1.2, false) + "]}";
        CandleBatch batch = OandaPriceSource::parseCandles(body);
        REQUIRE(batch.numCandles == 2);
        REQUIRE(batch.completeCandles.size() == 1);
        REQUIRE(batch.completeCandles[0].first == t0);
        REQUIRE(batch.completeCandles[0].second == Approx(1.1));
    }

    SECTION("Nanosecond time stamps")
    {
        std::string body = "{\"candles\":[{\"complete\":true,\"time\":\"2024-01-01T00:05:00.000000000Z\","
          "\"mid\":{\"c\":\"1.08512\"}}]}";
        CandleBatch batch = OandaPriceSource::parseCandles(body);
        REQUIRE(batch.completeCandles[0].first == t0 + minutes(5));
        REQUIRE(batch.completeCandles[0].second == Approx(1.08512));
    }

    SECTION("Errors")
    {
        REQUIRE_THROWS_AS(OandaPriceSource::parseCandles("not json"), PriceSourceIOException);
        REQUIRE_THROWS_AS(OandaPriceSource::parseCandles("{\"errorMessage\":\"Invalid value specified for 'granularity'\"}"),
                          PriceSourceIOException);
        REQUIRE_THROWS_AS(OandaPriceSource::parseCandles("{\"candles\":[{\"complete\":true,\"time\":\"2024-01-01T00:00:00Z\"}]}"),
                          PriceSourceIOException);
        REQUIRE(OandaPriceSource::parseCandles("{}").numCandles == 0);
    }
}

TEST_CASE("OandaPriceSource pages through full batches", "[OandaPriceSource]")
{
    const ptime t0 = time_from_string("2024-01-01 00:00:00");
    const ptime secondPageStart = t0 + minutes(5000);

    CannedOandaPriceSource source;
    source.addResponse(makeCandles(t0, 5000, minutes(1)));
    source.addResponse(makeCandles(secondPageStart, 3, minutes(1)));

    DateRange range(t0, time_from_string("2024-01-10 00:00:00"));
    PriceSeries series = source.fetch("EUR_USD", range, getBarIntervalFromString("1m"));

    REQUIRE(series.getNumEntries() == 5003);
    REQUIRE(series.getCurrency() == "USD");
    REQUIRE(series.getFirstDateTime() == t0);
    REQUIRE(series.getLastDateTime() == secondPageStart + minutes(2));

    REQUIRE(source.getRequests().size() == 2);
    REQUIRE(source.getRequests()[1].find("from=2024-01-04T11:20:00Z") != std::string::npos);
    REQUIRE(source.getRequests()[1].find("granularity=M1") != std::string::npos);
}

TEST_CASE("OandaPriceSource clips to the requested range", "[OandaPriceSource]")
{
    const ptime t0 = time_from_string("2024-01-01 00:00:00");
    CannedOandaPriceSource source;
    source.addResponse(makeCandles(t0, 10, minutes(60)));

    DateRange range(t0 + minutes(120), t0 + minutes(300));
    PriceSeries series = source.fetch("EUR_USD", range, getBarIntervalFromString("1h"));

    REQUIRE(series.getNumEntries() == 4);
    REQUIRE(series.getFirstDateTime() == t0 + minutes(120));
    REQUIRE(series.getLastDateTime() == t0 + minutes(300));
    REQUIRE(source.getRequests().size() == 1);
}

TEST_CASE("OandaPriceSource with no candles", "[OandaPriceSource]")
{
    CannedOandaPriceSource source;
    source.addResponse("{\"candles\":[]}");
    DateRange range(time_from_string("2024-01-01 00:00:00"), time_from_string("2024-01-02 00:00:00"));

    REQUIRE_THROWS_AS(source.fetch("EUR_USD", range, getBarIntervalFromString("1h")), PriceRangeException);
    REQUIRE_THROWS_AS(source.fetch("EUR_USD", range, getBarIntervalFromString("2h")), ConfigurationException);
}
