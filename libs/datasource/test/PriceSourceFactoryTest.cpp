#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include "OandaPriceSource.h"
#include "PriceSourceFactory.h"
#include "StatArbException.h"
#include "YahooPriceSource.h"
#include "TestUtils.h"

using namespace statarb;

TEST_CASE("PriceSourceFactory builds sources by name", "[PriceSourceFactory]")
{
    std::map<std::string, CsvSpecification> specs = {{"AAA", CsvSpecification("/tmp/aaa.csv")}};

    auto csv = PriceSourceFactory::getPriceSource("CSV", specs);
    REQUIRE(std::dynamic_pointer_cast<CsvPriceSource>(csv));
    REQUIRE(std::dynamic_pointer_cast<CsvPriceSource>(csv)->hasTicker("AAA"));

    auto oanda = PriceSourceFactory::getPriceSource("oanda", specs, "secret", "live");
    REQUIRE(std::dynamic_pointer_cast<OandaPriceSource>(oanda));
    REQUIRE(std::dynamic_pointer_cast<OandaPriceSource>(oanda)->getBaseUrl() == OandaPriceSource::LiveUrl);

    auto yahoo = PriceSourceFactory::getPriceSource("Yahoo", specs);
    REQUIRE(std::dynamic_pointer_cast<YahooPriceSource>(yahoo));
    REQUIRE(std::dynamic_pointer_cast<YahooPriceSource>(yahoo)->getUseAdjustedClose());

    REQUIRE_THROWS_AS(PriceSourceFactory::getPriceSource("bloomberg", specs), ConfigurationException);
    REQUIRE_THROWS_AS(PriceSourceFactory::getPriceSource("oanda", specs), ConfigurationException);
}

TEST_CASE("PriceSourceFactory reads API tokens", "[PriceSourceFactory]")
{
    const std::string path = writeTemporaryFile("finnhub,abc123\nOanda,tok-456\n", "apikeys");

    REQUIRE(PriceSourceFactory::getApiTokenFromFile(path, "oanda") == "tok-456");
    REQUIRE(PriceSourceFactory::getApiTokenFromFile(path, "FINNHUB") == "abc123");
    REQUIRE_THROWS_AS(PriceSourceFactory::getApiTokenFromFile(path, "barchart"), ConfigurationException);
    REQUIRE_THROWS_AS(PriceSourceFactory::getApiTokenFromFile("/nonexistent/keys.csv", "oanda"),
                      ConfigurationException);

    std::remove(path.c_str());
}
