// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <boost/algorithm/string.hpp>
#include "csv.h"
#include "OandaPriceSource.h"
#include "PriceSourceFactory.h"
#include "StatArbException.h"
#include "YahooPriceSource.h"

namespace statarb
{
  std::shared_ptr<PriceSource>
  PriceSourceFactory::getPriceSource(const std::string& sourceName,
				     const std::map<std::string, CsvSpecification>& csvSpecifications,
				     const std::string& apiToken,
				     const std::string& environment,
				     const std::map<std::string, std::string>& currencyOverrides)
  {
    if (boost::iequals(sourceName, "csv"))
      return std::make_shared<CsvPriceSource>(csvSpecifications);
    else if (boost::iequals(sourceName, "oanda"))
      return std::make_shared<OandaPriceSource>(apiToken, environment, currencyOverrides);
    else if (boost::iequals(sourceName, "yahoo"))
      return std::make_shared<YahooPriceSource>();
    else
      throw ConfigurationException("PriceSourceFactory::getPriceSource - data source "
				   + sourceName + " not recognized");
  }

  std::string PriceSourceFactory::getApiTokenFromFile(const std::string& apiConfigFilename,
						       const std::string& dataSourceName)
  {
    std::string source, token, result;

    try
      {
	io::CSVReader<2, io::trim_chars<' ', '\t'>> csvApiConfig(apiConfigFilename);
	csvApiConfig.set_header("Source", "Token");

	while (csvApiConfig.read_row(source, token))
	  if (boost::iequals(dataSourceName, source))
	    {
	      result = token;
	      break;
	    }
      }
    catch (const io::error::base& e)
      {
	throw ConfigurationException(std::string("PriceSourceFactory::getApiTokenFromFile - ") + e.what());
      }

    if (result.empty())
      throw ConfigurationException("PriceSourceFactory::getApiTokenFromFile - source " + dataSourceName
				   + " does not exist in " + apiConfigFilename);

    return result;
  }
}
