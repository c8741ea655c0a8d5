// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <curl/curl.h>
#include <rapidjson/document.h>
#include "OandaPriceSource.h"
#include "StatArbException.h"
#include "UtcTime.h"

namespace statarb
{
  using boost::posix_time::minutes;
  using boost::posix_time::hours;
  using boost::posix_time::time_duration;

  const std::string OandaPriceSource::PracticeUrl("https://api-fxpractice.oanda.com");
  const std::string OandaPriceSource::LiveUrl("https://api-fxtrade.oanda.com");

  static const std::map<std::string, std::string> intervalToGranularity = {
    {"1m", "M1"}, {"5m", "M5"}, {"15m", "M15"}, {"30m", "M30"},
    {"1h", "H1"}, {"4h", "H4"}, {"1d", "D"}, {"1w", "W"}
  };

  static const std::map<std::string, time_duration> granularityLength = {
    {"M1", minutes(1)}, {"M5", minutes(5)}, {"M15", minutes(15)}, {"M30", minutes(30)},
    {"H1", hours(1)}, {"H4", hours(4)}, {"D", hours(24)}, {"W", hours(24 * 7)}
  };

  static size_t curlWriteCallback(void *ptr, size_t size, size_t nmemb, std::string* data)
  {
    data->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
  }

  OandaPriceSource::OandaPriceSource(const std::string& apiToken,
				     const std::string& environment,
				     const std::map<std::string, std::string>& instrumentCurrencies)
    : mApiToken(apiToken),
      mBaseUrl(),
      mInstrumentCurrencies()
  {
    if (boost::trim_copy(apiToken).empty())
      throw ConfigurationException("OandaPriceSource: an API token must be provided");

    const std::string env = boost::to_lower_copy(boost::trim_copy(environment));
    if (env == "practice")
      mBaseUrl = PracticeUrl;
    else if (env == "live" || env == "trade" || env == "fxtrade")
      mBaseUrl = LiveUrl;
    else
      throw ConfigurationException("OandaPriceSource: environment must be practice or live, got "
				   + environment);

    for (const auto& kv : instrumentCurrencies)
      mInstrumentCurrencies[kv.first] = boost::to_upper_copy(kv.second);
  }

  std::string OandaPriceSource::getGranularity(const std::string& interval)
  {
    const std::string trimmed = boost::trim_copy(interval);
    if (trimmed.empty())
      throw ConfigurationException("OandaPriceSource::getGranularity - interval must not be empty");

    auto it = intervalToGranularity.find(boost::to_lower_copy(trimmed));
    if (it != intervalToGranularity.end())
      return it->second;

    const std::string native = boost::to_upper_copy(trimmed);
    if (granularityLength.find(native) != granularityLength.end())
      return native;

    throw ConfigurationException("OandaPriceSource::getGranularity - unsupported interval "
				 + interval + " for OANDA candles");
  }

  time_duration OandaPriceSource::getGranularityLength(const std::string& granularity)
  {
    auto it = granularityLength.find(granularity);
    if (it == granularityLength.end())
      throw ConfigurationException("OandaPriceSource::getGranularityLength - unknown granularity "
				   + granularity);
    return it->second;
  }

  std::string OandaPriceSource::getInstrumentCurrency(const std::string& instrument) const
  {
    auto it = mInstrumentCurrencies.find(instrument);
    if (it != mInstrumentCurrencies.end())
      return it->second;

    std::string::size_type pos = instrument.rfind('_');
    if (pos != std::string::npos && pos + 1 < instrument.size())
      return boost::to_upper_copy(instrument.substr(pos + 1));

    return "USD";
  }

  std::string OandaPriceSource::buildCandlesUri(const std::string& instrument,
						const std::string& granularity,
						const ptime& from) const
  {
    return (boost::format("%1%/v3/instruments/%2%/candles?price=M&granularity=%3%&from=%4%&count=%5%")
	    % mBaseUrl % instrument % granularity % toIsoUtcString(from) % getMaxBatchSize()).str();
  }

  CandleBatch OandaPriceSource::parseCandles(const std::string& payload)
  {
    rapidjson::Document document;
    document.Parse(payload.c_str());

    if (document.HasParseError() || !document.IsObject())
      throw PriceSourceIOException("OandaPriceSource::parseCandles - response is not a JSON object");

    if (document.HasMember("errorMessage") && document["errorMessage"].IsString())
      throw PriceSourceIOException(std::string("OandaPriceSource::parseCandles - API error: ")
				   + document["errorMessage"].GetString());

    CandleBatch batch;
    if (!document.HasMember("candles"))
      return batch;

    const rapidjson::Value& candles = document["candles"];
    if (!candles.IsArray())
      throw PriceSourceIOException("OandaPriceSource::parseCandles - candles is not an array");

    batch.numCandles = candles.Size();
    for (rapidjson::SizeType idx = 0; idx != candles.Size(); idx++)
      {
	const rapidjson::Value& candle = candles[idx];
	if (!candle.IsObject())
	  continue;

	if (!candle.HasMember("complete") || !candle["complete"].IsBool() || !candle["complete"].GetBool())
	  continue;

	if (!candle.HasMember("time") || !candle["time"].IsString() ||
	    !candle.HasMember("mid") || !candle["mid"].IsObject() ||
	    !candle["mid"].HasMember("c") || !candle["mid"]["c"].IsString())
	  throw PriceSourceIOException("OandaPriceSource::parseCandles - candle "
				       + std::to_string(idx) + " lacks time or mid close");

	try
	  {
	    ptime time = parseUtcTimestamp(candle["time"].GetString());
	    double close = boost::lexical_cast<double>(candle["mid"]["c"].GetString());
	    batch.completeCandles.emplace_back(time, close);
	  }
	catch (const std::invalid_argument& e)
	  {
	    throw PriceSourceIOException(std::string("OandaPriceSource::parseCandles - ") + e.what());
	  }
	catch (const boost::bad_lexical_cast&)
	  {
	    throw PriceSourceIOException(std::string("OandaPriceSource::parseCandles - bad close price ")
					 + candle["mid"]["c"].GetString());
	  }
      }

    return batch;
  }

  PriceSeries OandaPriceSource::fetch(const std::string& ticker,
				      const DateRange& range,
				      const BarInterval& interval)
  {
    const std::string granularity = getGranularity(interval.toString());
    const time_duration barLength = getGranularityLength(granularity);

    PriceSeries series(ticker, getInstrumentCurrency(ticker));
    ptime nextFrom = range.getFirstDateTime();
    ptime lastAdded;

    while (nextFrom < range.getLastDateTime())
      {
	CandleBatch batch = parseCandles(httpGet(buildCandlesUri(ticker, granularity, nextFrom)));
	if (batch.numCandles == 0)
	  break;

	bool pastEnd = false;
	bool added = false;
	for (const auto& candle : batch.completeCandles)
	  {
	    if (candle.first > range.getLastDateTime())
	      {
		pastEnd = true;
		break;
	      }

	    if (candle.first < range.getFirstDateTime())
	      continue;

	    if (!lastAdded.is_not_a_date_time() && candle.first <= lastAdded)
	      continue;

	    series.addEntry(candle.first, candle.second);
	    lastAdded = candle.first;
	    added = true;
	  }

	if (pastEnd || !added || batch.numCandles < getMaxBatchSize())
	  break;

	nextFrom = lastAdded + barLength;
      }

    if (series.empty())
      throw PriceRangeException("OandaPriceSource::fetch - no candles returned for " + ticker
				+ " in " + range.toString() + " at granularity " + granularity);

    return series;
  }

  std::string OandaPriceSource::httpGet(const std::string& uri) const
  {
    CURL *curl = curl_easy_init();
    if (!curl)
      throw PriceSourceIOException("OandaPriceSource::httpGet - curl_easy_init failed");

    std::string buffer;
    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, ("Authorization: Bearer " + mApiToken).c_str());
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, uri.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);

    CURLcode result = curl_easy_perform(curl);
    long responseCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &responseCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (result != CURLE_OK)
      throw PriceSourceIOException("OandaPriceSource::httpGet - " + uri + ": "
				   + curl_easy_strerror(result));

    if (responseCode == 404)
      throw PriceDataNotFoundException("OandaPriceSource::httpGet - instrument not found: " + uri);

    if (responseCode >= 400)
      throw PriceSourceIOException("OandaPriceSource::httpGet - HTTP " + std::to_string(responseCode)
				   + " from " + uri + ": " + buffer);

    return buffer;
  }
}
