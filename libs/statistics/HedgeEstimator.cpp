// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <boost/format.hpp>
#include "HedgeEstimator.h"
#include "StatArbException.h"

namespace statarb
{
  static std::string makeSummary(const LeastSquaresFit& fit,
				 const std::string& nameA,
				 const std::string& nameB,
				 bool hasIntercept)
  {
    const std::string doubleRule(78, '=');
    const std::string singleRule(78, '-');
    const std::string suffix = hasIntercept ? "" : " (uncentered)";

    std::ostringstream out;
    out << boost::format("%|=78|\n") % "OLS Regression Results";
    out << doubleRule << "\n";
    out << boost::format("%-18s%20s   %-28s%9.3f\n") % "Dep. Variable:" % nameA
      % ("R-squared" + suffix + ":") % fit.getRSquared();
    out << boost::format("%-18s%20s   %-28s%9.3f\n") % "Model:" % "OLS"
      % ("Adj. R-squared" + suffix + ":") % fit.getAdjustedRSquared();
    out << boost::format("%-18s%20d   %-28s%9.4g\n") % "No. Observations:" % fit.getNumObservations()
      % "Residual Std. Error:" % std::sqrt(fit.getResidualVariance());
    out << boost::format("%-18s%20d   %-28s%9.5g\n") % "Df Residuals:" % fit.getResidualDegreesOfFreedom()
      % "Log-Likelihood:" % fit.getLogLikelihood();
    out << boost::format("%-18s%20d   %-28s%9.4g\n") % "Df Model:" % (fit.getNumParameters() - (hasIntercept ? 1 : 0))
      % "AIC:" % fit.getAic();
    out << doubleRule << "\n";
    out << boost::format("%-14s%12s%12s%12s%12s\n") % "" % "coef" % "std err" % "t" % "P>|t|";
    out << singleRule << "\n";

    for (Eigen::Index i = 0; i < fit.getNumParameters(); ++i)
      {
	const std::string name = (hasIntercept && i == 0) ? std::string("const") : nameB;
	out << boost::format("%-14s%12.4f%12.3f%12.3f%12.3f\n") % name.substr(0, 14)
	  % fit.getCoefficient(i) % fit.getStandardError(i) % fit.getTValue(i) % fit.getPValue(i);
      }

    out << doubleRule << "\n";
    return out.str();
  }

  HedgeRatioResult HedgeEstimator::estimate(const std::vector<double>& a,
					    const std::vector<double>& b,
					    const std::string& nameA,
					    const std::string& nameB) const
  {
    if (a.size() != b.size())
      throw DataInsufficiencyException("HedgeEstimator::estimate - " + nameA + " has "
				       + std::to_string(a.size()) + " observations but " + nameB
				       + " has " + std::to_string(b.size()));

    std::vector<double> y, x;
    y.reserve(a.size());
    x.reserve(b.size());
    for (std::size_t i = 0; i < a.size(); ++i)
      if (std::isfinite(a[i]) && std::isfinite(b[i]))
	{
	  y.push_back(a[i]);
	  x.push_back(b[i]);
	}

    if (y.size() < 2)
      throw DataInsufficiencyException("HedgeEstimator::estimate - need at least 2 aligned observations of "
				       + nameA + " and " + nameB + ", got " + std::to_string(y.size()));

    const Eigen::Index n = static_cast<Eigen::Index>(y.size());
    const Eigen::Index k = mAddIntercept ? 2 : 1;

    Eigen::MatrixXd X(n, k);
    Eigen::VectorXd Y = Eigen::Map<const Eigen::VectorXd>(y.data(), n);
    for (Eigen::Index i = 0; i < n; ++i)
      {
	if (mAddIntercept)
	  {
	    X(i, 0) = 1.0;
	    X(i, 1) = x[i];
	  }
	else
	  X(i, 0) = x[i];
      }

    LeastSquaresFit fit = [&]() {
      try
	{
	  return fitLeastSquares(X, Y, mAddIntercept);
	}
      catch (const DataInsufficiencyException& e)
	{
	  throw DataInsufficiencyException("HedgeEstimator::estimate - cannot regress " + nameA
					   + " on " + nameB + ": " + e.what());
	}
    }();

    const double intercept = mAddIntercept ? fit.getCoefficient(0) : 0.0;
    const double ratio = fit.getCoefficient(mAddIntercept ? 1 : 0);

    return HedgeRatioResult(ratio, intercept, makeSummary(fit, nameA, nameB, mAddIntercept), fit);
  }

  HedgeRatioResult HedgeEstimator::estimate(const AlignedPair& pair) const
  {
    return estimate(pair.getValuesA(), pair.getValuesB(), pair.getTickerA(), pair.getTickerB());
  }

  std::vector<double> computeSpread(const std::vector<double>& a,
				    const std::vector<double>& b,
				    double ratio,
				    double intercept)
  {
    if (a.size() != b.size())
      throw std::invalid_argument("computeSpread: series lengths differ (" + std::to_string(a.size())
				  + " and " + std::to_string(b.size()) + ")");

    std::vector<double> spread;
    spread.reserve(a.size());
    for (std::size_t i = 0; i < a.size(); ++i)
      spread.push_back(a[i] - (ratio * b[i] + intercept));

    return spread;
  }

  NumericSeries computeSpread(const AlignedPair& pair, double ratio, double intercept)
  {
    return NumericSeries(pair.getTimeIndex(),
			 computeSpread(pair.getValuesA(), pair.getValuesB(), ratio, intercept));
  }
}
