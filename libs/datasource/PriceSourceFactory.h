// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_PRICE_SOURCE_FACTORY_H
#define __STATARB_PRICE_SOURCE_FACTORY_H 1

#include <map>
#include <memory>
#include <string>
#include "CsvPriceSource.h"
#include "PriceSource.h"

namespace statarb
{
  class PriceSourceFactory
  {
  public:
    /**
     * @brief Builds the source named by sourceName ("csv", "oanda" or "yahoo").
     *
     * The CSV source uses csvSpecifications; the OANDA source uses apiToken,
     * environment and currencyOverrides. The Yahoo source needs no
     * credentials.
     *
     * @throws ConfigurationException for an unknown source name.
     */
    static std::shared_ptr<PriceSource>
    getPriceSource(const std::string& sourceName,
		   const std::map<std::string, CsvSpecification>& csvSpecifications,
		   const std::string& apiToken = "",
		   const std::string& environment = "practice",
		   const std::map<std::string, std::string>& currencyOverrides = {});

    // Token for dataSourceName from a CSV file with rows Source,Token
    static std::string getApiTokenFromFile(const std::string& apiConfigFilename,
					   const std::string& dataSourceName);
  };
}

#endif
