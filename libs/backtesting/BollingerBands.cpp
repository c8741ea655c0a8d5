// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include "BollingerBands.h"
#include "StatArbException.h"

namespace statarb
{
  BandSignalGenerator::BandSignalGenerator(double numStd)
    : mNumStd(numStd)
  {
    if (!std::isfinite(numStd))
      throw ConfigurationException("BandSignalGenerator: number of standard deviations must be finite");
  }

  BollingerBands BandSignalGenerator::compute(const NumericSeries& spread, unsigned int window) const
  {
    if (window == 0)
      throw ConfigurationException("BandSignalGenerator::compute - window must be at least 1, got 0");

    const std::vector<double>& values = spread.getValues();
    const std::size_t n = values.size();

    std::vector<boost::optional<double>> mean(n), stdDev(n), upper(n), lower(n);

    for (std::size_t end = window; end <= n; ++end)
      {
	const std::size_t begin = end - window;

	double sum = 0.0;
	bool complete = true;
	for (std::size_t i = begin; i < end; ++i)
	  {
	    if (!std::isfinite(values[i]))
	      {
		complete = false;
		break;
	      }
	    sum += values[i];
	  }

	if (!complete)
	  continue;

	const double windowMean = sum / window;

	double sumSquares = 0.0;
	for (std::size_t i = begin; i < end; ++i)
	  {
	    const double deviation = values[i] - windowMean;
	    sumSquares += deviation * deviation;
	  }

	const double windowStd = std::sqrt(sumSquares / window);
	const std::size_t bar = end - 1;

	mean[bar] = windowMean;
	stdDev[bar] = windowStd;
	upper[bar] = windowMean + mNumStd * windowStd;
	lower[bar] = windowMean - mNumStd * windowStd;
      }

    const TimeIndex& index = spread.getTimeIndex();
    return BollingerBands(window, mNumStd,
			  OptionalSeries(index, std::move(mean)),
			  OptionalSeries(index, std::move(stdDev)),
			  OptionalSeries(index, std::move(upper)),
			  OptionalSeries(index, std::move(lower)));
  }

  std::map<unsigned int, BollingerBands>
  BandSignalGenerator::computeMany(const NumericSeries& spread, const std::vector<unsigned int>& windows) const
  {
    std::map<unsigned int, BollingerBands> bands;
    for (unsigned int window : windows)
      if (bands.find(window) == bands.end())
	bands.emplace(window, compute(spread, window));

    return bands;
  }
}
