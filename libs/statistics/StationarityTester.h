// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_STATIONARITY_TESTER_H
#define __STATARB_STATIONARITY_TESTER_H 1

#include <map>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "MacKinnon.h"
#include "NumericSeries.h"

namespace statarb
{
  // Information criterion used to pick the number of lagged differences
  enum class LagSelection {Aic, Bic, None};

  class AdfResult
  {
  public:
    AdfResult(double statistic,
	      double pValue,
	      unsigned int usedLag,
	      long nobs,
	      const std::map<std::string, double>& criticalValues,
	      const boost::optional<double>& icBest)
      : mStatistic(statistic),
	mPValue(pValue),
	mUsedLag(usedLag),
	mNobs(nobs),
	mCriticalValues(criticalValues),
	mIcBest(icBest)
    {}

    double getStatistic() const
    {
      return mStatistic;
    }

    double getPValue() const
    {
      return mPValue;
    }

    unsigned int getUsedLag() const
    {
      return mUsedLag;
    }

    // Observations in the final regression
    long getNumObservations() const
    {
      return mNobs;
    }

    // Keyed "1%", "5%" and "10%"
    const std::map<std::string, double>& getCriticalValues() const
    {
      return mCriticalValues;
    }

    double getCriticalValue(const std::string& level) const
    {
      return mCriticalValues.at(level);
    }

    // Best information criterion value; absent when the lag was not selected
    const boost::optional<double>& getIcBest() const
    {
      return mIcBest;
    }

    // true if the unit root hypothesis is rejected at the given significance
    bool isStationary(double significance = 0.05) const
    {
      return mPValue < significance;
    }

  private:
    double mStatistic;
    double mPValue;
    unsigned int mUsedLag;
    long mNobs;
    std::map<std::string, double> mCriticalValues;
    boost::optional<double> mIcBest;
  };

  //
  // class StationarityTester
  //
  // Augmented Dickey-Fuller unit root test. Without an explicit maximum lag
  // the search runs up to ceil(12 * (n / 100)^(1/4)) lagged differences,
  // capped at n / 2 - (deterministic terms) - 1. Candidate lags are compared
  // on a common sample; the chosen lag is then refitted on the longest
  // sample it allows.
  //
  class StationarityTester
  {
  public:
    explicit StationarityTester(DeterministicTerms terms = DeterministicTerms::Constant,
				LagSelection lagSelection = LagSelection::Aic,
				const boost::optional<unsigned int>& maxLag = boost::none)
      : mTerms(terms),
	mLagSelection(lagSelection),
	mMaxLag(maxLag)
    {}

    /**
     * @brief Runs the test on series after dropping non-finite values.
     *
     * @throws DataInsufficiencyException if the series is constant or too
     * short for the regression, or maxLag is too large for its length.
     */
    AdfResult test(const std::vector<double>& series) const;

    AdfResult test(const NumericSeries& series) const
    {
      return test(series.getValues());
    }

    DeterministicTerms getDeterministicTerms() const
    {
      return mTerms;
    }

    LagSelection getLagSelection() const
    {
      return mLagSelection;
    }

  private:
    DeterministicTerms mTerms;
    LagSelection mLagSelection;
    boost::optional<unsigned int> mMaxLag;
  };
}

#endif
