// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <limits>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "CsvPriceSource.h"
#include "StatArbException.h"
#include "UtcTime.h"

namespace statarb
{
  typedef io::CSVReader<2, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '"'>> PriceFileReader;

  CsvPriceSource::CsvPriceSource(const std::map<std::string, CsvSpecification>& specifications)
    : mSpecifications()
  {
    for (const auto& kv : specifications)
      addSpecification(kv.first, kv.second);
  }

  void CsvPriceSource::addSpecification(const std::string& ticker, const CsvSpecification& specification)
  {
    if (specification.path.empty())
      throw ConfigurationException("CsvPriceSource::addSpecification - empty file path for " + ticker);

    auto result = mSpecifications.emplace(ticker, specification);
    if (!result.second)
      throw ConfigurationException("CsvPriceSource::addSpecification - ticker " + ticker
				   + " already configured");
  }

  PriceSeries CsvPriceSource::fetch(const std::string& ticker,
				    const DateRange& range,
				    const BarInterval& interval)
  {
    auto it = mSpecifications.find(ticker);
    if (it == mSpecifications.end())
      throw PriceDataNotFoundException("CsvPriceSource::fetch - ticker " + ticker
				       + " is not configured for the CSV source");

    const CsvSpecification& spec = it->second;
    PriceSeries series(ticker, spec.currency);

    try
      {
	PriceFileReader reader(spec.path);
	reader.read_header(io::ignore_extra_column, spec.timestampColumn, spec.priceColumn);

	std::string timestampStr, priceStr;
	while (reader.read_row(timestampStr, priceStr))
	  {
	    ptime timestamp;
	    double price = std::numeric_limits<double>::quiet_NaN();

	    try
	      {
		timestamp = parseUtcTimestamp(timestampStr);
		boost::trim(priceStr);
		if (!priceStr.empty())
		  price = boost::lexical_cast<double>(priceStr);
	      }
	    catch (const std::invalid_argument& e)
	      {
		throw PriceSourceIOException("CsvPriceSource::fetch - " + spec.path + " line "
					     + std::to_string(reader.get_file_line()) + ": " + e.what());
	      }
	    catch (const boost::bad_lexical_cast&)
	      {
		throw PriceSourceIOException("CsvPriceSource::fetch - " + spec.path + " line "
					     + std::to_string(reader.get_file_line())
					     + ": bad price " + priceStr);
	      }

	    if (range.contains(timestamp))
	      series.addEntry(timestamp, price);
	  }
      }
    catch (const io::error::can_not_open_file& e)
      {
	throw PriceSourceIOException(std::string("CsvPriceSource::fetch - ") + e.what());
      }
    catch (const io::error::missing_column_in_header& e)
      {
	throw ConfigurationException(std::string("CsvPriceSource::fetch - ") + e.what()
				     + " (ticker " + ticker + ")");
      }
    catch (const io::error::base& e)
      {
	throw PriceSourceIOException(std::string("CsvPriceSource::fetch - ") + e.what());
      }

    if (series.empty())
      throw PriceRangeException("CsvPriceSource::fetch - no rows for " + ticker + " in "
				+ range.toString() + " at interval " + interval.toString()
				+ " in " + spec.path);

    return series;
  }
}
