// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <iterator>
#include <cmath>
#include <limits>
#include "StationarityTester.h"
#include "LeastSquares.h"
#include "StatArbException.h"

namespace statarb
{
  namespace
  {
    //
    // Builds the regression of diff(x)[t] on the level x[t], numLags lagged
    // differences and the deterministic terms, for every t with a full set
    // of lags. Deterministic columns come first when prependTerms is set.
    //
    void buildAdfRegression(const std::vector<double>& x,
			    const std::vector<double>& xdiff,
			    unsigned int numLags,
			    DeterministicTerms terms,
			    bool prependTerms,
			    Eigen::MatrixXd& X,
			    Eigen::VectorXd& y)
    {
      const Eigen::Index nobs = static_cast<Eigen::Index>(xdiff.size()) - numLags;
      const int ntrend = getNumDeterministicTerms(terms);
      const Eigen::Index numCols = 1 + numLags + ntrend;

      X.resize(nobs, numCols);
      y.resize(nobs);

      for (Eigen::Index r = 0; r < nobs; ++r)
	{
	  const std::size_t t = numLags + static_cast<std::size_t>(r);
	  y(r) = xdiff[t];

	  Eigen::Index col = 0;
	  auto addTerms = [&]() {
	    if (ntrend >= 1)
	      X(r, col++) = 1.0;
	    if (ntrend >= 2)
	      X(r, col++) = static_cast<double>(r + 1);
	  };

	  if (prependTerms)
	    addTerms();

	  X(r, col++) = x[t];
	  for (unsigned int j = 1; j <= numLags; ++j)
	    X(r, col++) = xdiff[t - j];

	  if (!prependTerms)
	    addTerms();
	}
    }

    double informationCriterion(const LeastSquaresFit& fit, LagSelection lagSelection)
    {
      return (lagSelection == LagSelection::Bic) ? fit.getBic() : fit.getAic();
    }
  }

  AdfResult StationarityTester::test(const std::vector<double>& series) const
  {
    std::vector<double> x;
    x.reserve(series.size());
    std::copy_if(series.begin(), series.end(), std::back_inserter(x),
		 [](double v) { return std::isfinite(v); });

    const long n = static_cast<long>(x.size());
    if (n < 2)
      throw DataInsufficiencyException("StationarityTester::test - need at least 2 observations, got "
				       + std::to_string(n));

    auto minMax = std::minmax_element(x.begin(), x.end());
    if (*minMax.first == *minMax.second)
      throw DataInsufficiencyException("StationarityTester::test - series is constant");

    const long ntrend = getNumDeterministicTerms(mTerms);
    const long lagLimit = n / 2 - ntrend - 1;

    long maxLag;
    if (mMaxLag)
      {
	maxLag = static_cast<long>(*mMaxLag);
	if (maxLag > lagLimit)
	  throw DataInsufficiencyException("StationarityTester::test - maximum lag " + std::to_string(maxLag)
					   + " too large for " + std::to_string(n)
					   + " observations (at most " + std::to_string(lagLimit) + ")");
      }
    else
      {
	maxLag = static_cast<long>(std::ceil(12.0 * std::pow(n / 100.0, 0.25)));
	maxLag = std::min(lagLimit, maxLag);
	if (maxLag < 0)
	  throw DataInsufficiencyException("StationarityTester::test - " + std::to_string(n)
					   + " observations are too few for regression '"
					   + toString(mTerms) + "'");
      }

    std::vector<double> xdiff(x.size() - 1);
    for (std::size_t i = 0; i + 1 < x.size(); ++i)
      xdiff[i] = x[i + 1] - x[i];

    unsigned int usedLag = static_cast<unsigned int>(maxLag);
    boost::optional<double> icBest;

    try
      {
	if (mLagSelection != LagSelection::None)
	  {
	    Eigen::MatrixXd fullX;
	    Eigen::VectorXd y;
	    buildAdfRegression(x, xdiff, usedLag, mTerms, true, fullX, y);

	    const Eigen::Index startCols = ntrend + 1;
	    for (long lag = 0; lag <= maxLag; ++lag)
	      {
		LeastSquaresFit fit = fitLeastSquares(fullX.leftCols(startCols + lag), y, ntrend > 0);
		const double ic = informationCriterion(fit, mLagSelection);

		if (!icBest || ic < *icBest)
		  {
		    icBest = ic;
		    usedLag = static_cast<unsigned int>(lag);
		  }
	      }
	  }

	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	buildAdfRegression(x, xdiff, usedLag, mTerms, false, X, y);
	LeastSquaresFit fit = fitLeastSquares(X, y, ntrend > 0);

	// level coefficient is the first column
	const double statistic = fit.getTValue(0);
	const long nobs = fit.getNumObservations();

	return AdfResult(statistic,
			 mackinnonPValue(statistic, mTerms),
			 usedLag,
			 nobs,
			 mackinnonCriticalValues(mTerms, nobs),
			 icBest);
      }
    catch (const DataInsufficiencyException& e)
      {
	throw DataInsufficiencyException(std::string("StationarityTester::test - ") + e.what());
      }
  }
}
