// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_BOLLINGER_BANDS_H
#define __STATARB_BOLLINGER_BANDS_H 1

#include <map>
#include <vector>
#include "NumericSeries.h"

namespace statarb
{
  //
  // class BollingerBands
  //
  // Rolling mean and population standard deviation of a spread over a
  // trailing window, with upper = mean + numStd * std and
  // lower = mean - numStd * std. The first window - 1 points are undefined.
  //
  class BollingerBands
  {
  public:
    BollingerBands(unsigned int window,
		   double numStd,
		   const OptionalSeries& mean,
		   const OptionalSeries& std,
		   const OptionalSeries& upper,
		   const OptionalSeries& lower)
      : mWindow(window),
	mNumStd(numStd),
	mMean(mean),
	mStd(std),
	mUpper(upper),
	mLower(lower)
    {}

    unsigned int getWindow() const
    {
      return mWindow;
    }

    double getNumStd() const
    {
      return mNumStd;
    }

    std::size_t size() const
    {
      return mMean.size();
    }

    const OptionalSeries& getMean() const
    {
      return mMean;
    }

    const OptionalSeries& getStd() const
    {
      return mStd;
    }

    const OptionalSeries& getUpper() const
    {
      return mUpper;
    }

    const OptionalSeries& getLower() const
    {
      return mLower;
    }

    // true once mean, upper and lower all have a value at bar i
    bool isDefined(std::size_t i) const
    {
      return mMean.isDefined(i) && mUpper.isDefined(i) && mLower.isDefined(i);
    }

  private:
    unsigned int mWindow;
    double mNumStd;
    OptionalSeries mMean;
    OptionalSeries mStd;
    OptionalSeries mUpper;
    OptionalSeries mLower;
  };

  class BandSignalGenerator
  {
  public:
    explicit BandSignalGenerator(double numStd);

    double getNumStd() const
    {
      return mNumStd;
    }

    /**
     * @brief Computes bands over windows of exactly window observations.
     *
     * A window containing a non-finite value has no bands. A window longer
     * than the spread leaves every point undefined.
     *
     * @throws ConfigurationException if window is zero.
     */
    BollingerBands compute(const NumericSeries& spread, unsigned int window) const;

    // Bands for each distinct window, keyed by window length
    std::map<unsigned int, BollingerBands> computeMany(const NumericSeries& spread,
						       const std::vector<unsigned int>& windows) const;

  private:
    double mNumStd;
  };
}

#endif
