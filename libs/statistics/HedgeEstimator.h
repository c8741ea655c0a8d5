// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_HEDGE_ESTIMATOR_H
#define __STATARB_HEDGE_ESTIMATOR_H 1

#include <string>
#include <vector>
#include "AlignedPair.h"
#include "LeastSquares.h"
#include "NumericSeries.h"

namespace statarb
{
  class HedgeRatioResult
  {
  public:
    HedgeRatioResult(double ratio, double intercept, const std::string& summary, const LeastSquaresFit& fit)
      : mRatio(ratio),
	mIntercept(intercept),
	mSummary(summary),
	mFit(fit)
    {}

    double getRatio() const
    {
      return mRatio;
    }

    // 0.0 when the regression has no intercept
    double getIntercept() const
    {
      return mIntercept;
    }

    // Printable regression table
    const std::string& getSummary() const
    {
      return mSummary;
    }

    const LeastSquaresFit& getFit() const
    {
      return mFit;
    }

  private:
    double mRatio;
    double mIntercept;
    std::string mSummary;
    LeastSquaresFit mFit;
  };

  //
  // class HedgeEstimator
  //
  // Regresses leg A on leg B by ordinary least squares, optionally with an
  // intercept. The slope is the hedge ratio: units of B held against one unit
  // of A.
  //
  class HedgeEstimator
  {
  public:
    explicit HedgeEstimator(bool addIntercept = false)
      : mAddIntercept(addIntercept)
    {}

    bool getAddIntercept() const
    {
      return mAddIntercept;
    }

    /**
     * @brief Estimates the hedge ratio of a relative to b.
     *
     * Pairs where either value is not finite are ignored.
     *
     * @throws DataInsufficiencyException with fewer than two usable
     * observations or when b cannot explain a (constant b with an intercept,
     * all zero b without).
     */
    HedgeRatioResult estimate(const std::vector<double>& a,
			      const std::vector<double>& b,
			      const std::string& nameA = "A",
			      const std::string& nameB = "B") const;

    HedgeRatioResult estimate(const AlignedPair& pair) const;

  private:
    bool mAddIntercept;
  };

  // a - (ratio * b + intercept) element by element
  std::vector<double> computeSpread(const std::vector<double>& a,
				    const std::vector<double>& b,
				    double ratio,
				    double intercept = 0.0);

  NumericSeries computeSpread(const AlignedPair& pair, double ratio, double intercept = 0.0);
}

#endif
