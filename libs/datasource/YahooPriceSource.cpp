// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <limits>
#include <map>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <curl/curl.h>
#include <rapidjson/document.h>
#include "YahooPriceSource.h"
#include "StatArbException.h"
#include "UtcTime.h"

namespace statarb
{
  const std::string YahooPriceSource::ChartUrl("https://query1.finance.yahoo.com/v8/finance/chart");

  static const std::map<std::string, std::string> intervalToChartInterval = {
    {"1m", "1m"}, {"2m", "2m"}, {"5m", "5m"}, {"15m", "15m"}, {"30m", "30m"},
    {"60m", "60m"}, {"90m", "90m"}, {"1h", "60m"}, {"1d", "1d"}, {"1w", "1wk"}
  };

  static size_t curlWriteCallback(void *ptr, size_t size, size_t nmemb, std::string* data)
  {
    data->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
  }

  // Numeric array member of value, NaN for null entries
  static std::vector<double> getPriceArray(const rapidjson::Value& value, const char *member)
  {
    std::vector<double> prices;
    if (!value.IsObject() || !value.HasMember(member) || !value[member].IsArray())
      return prices;

    const rapidjson::Value& array = value[member];
    prices.reserve(array.Size());
    for (rapidjson::SizeType idx = 0; idx != array.Size(); idx++)
      prices.push_back(array[idx].IsNumber() ? array[idx].GetDouble()
		       : std::numeric_limits<double>::quiet_NaN());

    return prices;
  }

  // First element of the array member of value, or nullptr
  static const rapidjson::Value* getFirstElement(const rapidjson::Value& value, const char *member)
  {
    if (!value.IsObject() || !value.HasMember(member) || !value[member].IsArray() ||
	value[member].Empty())
      return nullptr;

    return &value[member][0];
  }

  YahooPriceSource::YahooPriceSource(bool useAdjustedClose)
    : mUseAdjustedClose(useAdjustedClose)
  {}

  std::string YahooPriceSource::getChartInterval(const std::string& interval)
  {
    const std::string key = boost::to_lower_copy(boost::trim_copy(interval));
    auto it = intervalToChartInterval.find(key);
    if (it == intervalToChartInterval.end())
      throw ConfigurationException("YahooPriceSource::getChartInterval - unsupported interval "
				   + interval + " for Yahoo Finance");
    return it->second;
  }

  std::string YahooPriceSource::buildChartUri(const std::string& ticker,
					      const std::string& chartInterval,
					      const DateRange& range) const
  {
    // period2 is exclusive
    return (boost::format("%1%/%2%?period1=%3%&period2=%4%&interval=%5%&includeAdjustedClose=true")
	    % ChartUrl % ticker % toEpochSeconds(range.getFirstDateTime())
	    % (toEpochSeconds(range.getLastDateTime()) + 1) % chartInterval).str();
  }

  ChartResponse YahooPriceSource::parseChart(const std::string& payload, bool useAdjustedClose)
  {
    rapidjson::Document document;
    document.Parse(payload.c_str());

    if (document.HasParseError() || !document.IsObject() || !document.HasMember("chart") ||
	!document["chart"].IsObject())
      throw PriceSourceIOException("YahooPriceSource::parseChart - response is not a chart object");

    const rapidjson::Value& chart = document["chart"];
    if (chart.HasMember("error") && chart["error"].IsObject())
      {
	const rapidjson::Value& error = chart["error"];
	std::string code = (error.HasMember("code") && error["code"].IsString()) ? error["code"].GetString() : "";
	std::string description = (error.HasMember("description") && error["description"].IsString())
	  ? error["description"].GetString() : code;

	if (boost::iequals(code, "Not Found"))
	  throw PriceDataNotFoundException("YahooPriceSource::parseChart - " + description);

	throw PriceSourceIOException("YahooPriceSource::parseChart - API error: " + description);
      }

    const rapidjson::Value* result = getFirstElement(chart, "result");
    if (!result || !result->IsObject())
      throw PriceSourceIOException("YahooPriceSource::parseChart - response has no result");

    ChartResponse response;
    response.currency = "USD";
    if (result->HasMember("meta") && (*result)["meta"].IsObject())
      {
	const rapidjson::Value& meta = (*result)["meta"];
	if (meta.HasMember("currency") && meta["currency"].IsString())
	  {
	    std::string currency = boost::to_upper_copy(boost::trim_copy(std::string(meta["currency"].GetString())));
	    if (!currency.empty())
	      response.currency = currency;
	  }
      }

    // A range without trading has no time stamps at all
    if (!result->HasMember("timestamp"))
      return response;

    const rapidjson::Value& timestamps = (*result)["timestamp"];
    if (!timestamps.IsArray())
      throw PriceSourceIOException("YahooPriceSource::parseChart - timestamp is not an array");

    const rapidjson::Value& indicators = result->HasMember("indicators") ? (*result)["indicators"] : *result;
    std::vector<double> closes;

    if (useAdjustedClose)
      if (const rapidjson::Value* adjusted = getFirstElement(indicators, "adjclose"))
	closes = getPriceArray(*adjusted, "adjclose");

    if (closes.empty())
      if (const rapidjson::Value* quote = getFirstElement(indicators, "quote"))
	closes = getPriceArray(*quote, "close");

    if (closes.size() != timestamps.Size())
      throw PriceSourceIOException("YahooPriceSource::parseChart - "
				   + std::to_string(timestamps.Size()) + " time stamps but "
				   + std::to_string(closes.size()) + " close prices");

    static const ptime epoch(boost::gregorian::date(1970, 1, 1));
    response.closes.reserve(closes.size());
    for (rapidjson::SizeType idx = 0; idx != timestamps.Size(); idx++)
      {
	if (!timestamps[idx].IsInt64())
	  throw PriceSourceIOException("YahooPriceSource::parseChart - time stamp "
				       + std::to_string(idx) + " is not an integer");

	response.closes.emplace_back(epoch + boost::posix_time::seconds(timestamps[idx].GetInt64()),
				     closes[idx]);
      }

    return response;
  }

  PriceSeries YahooPriceSource::fetch(const std::string& ticker,
				      const DateRange& range,
				      const BarInterval& interval)
  {
    const std::string chartInterval = getChartInterval(interval.toString());
    ChartResponse response = parseChart(httpGet(buildChartUri(ticker, chartInterval, range)),
					mUseAdjustedClose);

    PriceSeries series(ticker, response.currency);
    for (const auto& close : response.closes)
      {
	if (!range.contains(close.first) || series.isDateTimeFound(close.first))
	  continue;

	series.addEntry(close.first, close.second);
      }

    if (series.empty())
      throw PriceRangeException("YahooPriceSource::fetch - no prices returned for " + ticker
				+ " in " + range.toString() + " at interval " + chartInterval);

    return series;
  }

  std::string YahooPriceSource::httpGet(const std::string& uri) const
  {
    CURL *curl = curl_easy_init();
    if (!curl)
      throw PriceSourceIOException("YahooPriceSource::httpGet - curl_easy_init failed");

    std::string buffer;
    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, uri.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "Mozilla/5.0");
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
      throw PriceSourceIOException("YahooPriceSource::httpGet - " + uri + ": "
				   + curl_easy_strerror(result));

    if (responseCode == 404)
      throw PriceDataNotFoundException("YahooPriceSource::httpGet - symbol not found: " + uri);

    if (responseCode >= 400)
      throw PriceSourceIOException("YahooPriceSource::httpGet - HTTP " + std::to_string(responseCode)
				   + " from " + uri + ": " + buffer);

    return buffer;
  }
}
