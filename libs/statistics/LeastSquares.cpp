// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <boost/math/constants/constants.hpp>
#include <boost/math/distributions/students_t.hpp>
#include "LeastSquares.h"
#include "StatArbException.h"

namespace statarb
{
  LeastSquaresFit::LeastSquaresFit(const Eigen::VectorXd& coefficients,
				   const Eigen::VectorXd& standardErrors,
				   const Eigen::VectorXd& residuals,
				   double totalSumOfSquares,
				   double centeredTotalSumOfSquares,
				   bool hasIntercept)
    : mCoefficients(coefficients),
      mStandardErrors(standardErrors),
      mResiduals(residuals),
      mSumSquaredResiduals(residuals.squaredNorm()),
      mTotalSumOfSquares(totalSumOfSquares),
      mCenteredTotalSumOfSquares(centeredTotalSumOfSquares),
      mHasIntercept(hasIntercept)
  {}

  double LeastSquaresFit::getResidualVariance() const
  {
    const long df = getResidualDegreesOfFreedom();
    if (df <= 0)
      return std::numeric_limits<double>::quiet_NaN();

    return mSumSquaredResiduals / static_cast<double>(df);
  }

  double LeastSquaresFit::getPValue(Eigen::Index i) const
  {
    const long df = getResidualDegreesOfFreedom();
    const double t = getTValue(i);
    if (df <= 0 || !std::isfinite(t))
      return std::numeric_limits<double>::quiet_NaN();

    boost::math::students_t dist(static_cast<double>(df));
    return 2.0 * boost::math::cdf(boost::math::complement(dist, std::fabs(t)));
  }

  double LeastSquaresFit::getRSquared() const
  {
    const double tss = mHasIntercept ? mCenteredTotalSumOfSquares : mTotalSumOfSquares;
    if (tss == 0.0)
      return std::numeric_limits<double>::quiet_NaN();

    return 1.0 - mSumSquaredResiduals / tss;
  }

  double LeastSquaresFit::getAdjustedRSquared() const
  {
    const long df = getResidualDegreesOfFreedom();
    if (df <= 0)
      return std::numeric_limits<double>::quiet_NaN();

    const double numConstants = mHasIntercept ? 1.0 : 0.0;
    return 1.0 - ((getNumObservations() - numConstants) / static_cast<double>(df)) * (1.0 - getRSquared());
  }

  double LeastSquaresFit::getLogLikelihood() const
  {
    const double n = static_cast<double>(getNumObservations());
    const double twoPi = boost::math::constants::two_pi<double>();

    return -0.5 * n * (std::log(twoPi) + std::log(mSumSquaredResiduals / n) + 1.0);
  }

  double LeastSquaresFit::getAic() const
  {
    return -2.0 * getLogLikelihood() + 2.0 * getNumParameters();
  }

  double LeastSquaresFit::getBic() const
  {
    return -2.0 * getLogLikelihood() + std::log(static_cast<double>(getNumObservations())) * getNumParameters();
  }

  LeastSquaresFit fitLeastSquares(const Eigen::MatrixXd& X, const Eigen::VectorXd& y, bool hasIntercept)
  {
    const Eigen::Index n = X.rows();
    const Eigen::Index k = X.cols();

    if (y.size() != n)
      throw std::invalid_argument("fitLeastSquares: design matrix has " + std::to_string(n)
				  + " rows but response has " + std::to_string(y.size()));

    if (n == 0 || k == 0 || n < k)
      throw DataInsufficiencyException("fitLeastSquares: cannot fit " + std::to_string(k)
				       + " parameters from " + std::to_string(n) + " observations");

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
    if (qr.rank() < k)
      throw DataInsufficiencyException("fitLeastSquares: design matrix is rank deficient (rank "
				       + std::to_string(qr.rank()) + " of " + std::to_string(k) + ")");

    Eigen::VectorXd beta = qr.solve(y);
    Eigen::VectorXd residuals = y - X * beta;

    const double ssr = residuals.squaredNorm();
    const long df = static_cast<long>(n - k);
    const double sigma2 = (df > 0) ? ssr / static_cast<double>(df) : std::numeric_limits<double>::quiet_NaN();

    // Diagonal of (X'X)^-1 via solve instead of a full inverse
    Eigen::LDLT<Eigen::MatrixXd> ldlt = (X.transpose() * X).ldlt();
    Eigen::VectorXd standardErrors(k);
    for (Eigen::Index i = 0; i < k; ++i)
      {
	Eigen::VectorXd e = Eigen::VectorXd::Zero(k);
	e(i) = 1.0;
	standardErrors(i) = std::sqrt(sigma2 * ldlt.solve(e)(i));
      }

    const double totalSumOfSquares = y.squaredNorm();
    const double centeredTotalSumOfSquares = (y.array() - y.mean()).matrix().squaredNorm();

    return LeastSquaresFit(beta, standardErrors, residuals,
			   totalSumOfSquares, centeredTotalSumOfSquares, hasIntercept);
  }
}
