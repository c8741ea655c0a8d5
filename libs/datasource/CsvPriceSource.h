// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_CSV_PRICE_SOURCE_H
#define __STATARB_CSV_PRICE_SOURCE_H 1

#include <map>
#include <string>
#include "PriceSource.h"

namespace statarb
{
  // Where a ticker's prices live and how the file is laid out
  struct CsvSpecification
  {
    CsvSpecification(const std::string& filePath,
		     const std::string& priceColumnName = "close",
		     const std::string& timestampColumnName = "timestamp",
		     const std::string& currencyCode = "USD")
      : path(filePath),
	priceColumn(priceColumnName),
	timestampColumn(timestampColumnName),
	currency(currencyCode)
    {}

    std::string path;
    std::string priceColumn;
    std::string timestampColumn;
    std::string currency;
  };

  //
  // class CsvPriceSource
  //
  // Reads one CSV file per ticker. The file needs a header row naming the
  // time stamp and price columns; other columns are ignored. Time stamps are
  // parsed with parseUtcTimestamp. An empty price cell is a missing value
  // (NaN). The bar interval is not checked against the file.
  //
  class CsvPriceSource : public PriceSource
  {
  public:
    CsvPriceSource() = default;
    explicit CsvPriceSource(const std::map<std::string, CsvSpecification>& specifications);

    void addSpecification(const std::string& ticker, const CsvSpecification& specification);

    bool hasTicker(const std::string& ticker) const
    {
      return mSpecifications.find(ticker) != mSpecifications.end();
    }

    /**
     * @throws PriceDataNotFoundException if no file is configured for ticker.
     * @throws ConfigurationException if a configured column is missing.
     * @throws PriceSourceIOException if the file cannot be read or a row
     * cannot be parsed.
     * @throws PriceRangeException if no row lies inside range.
     */
    PriceSeries fetch(const std::string& ticker,
		      const DateRange& range,
		      const BarInterval& interval) override;

  private:
    std::map<std::string, CsvSpecification> mSpecifications;
  };
}

#endif
