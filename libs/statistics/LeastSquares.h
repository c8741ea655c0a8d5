// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_LEAST_SQUARES_H
#define __STATARB_LEAST_SQUARES_H 1

#include <Eigen/Dense>

namespace statarb
{
  //
  // class LeastSquaresFit
  //
  // Result of an ordinary least squares regression y = X b + e. Information
  // criteria use the Gaussian log likelihood and count every column of X as
  // a parameter.
  //
  class LeastSquaresFit
  {
  public:
    LeastSquaresFit(const Eigen::VectorXd& coefficients,
		    const Eigen::VectorXd& standardErrors,
		    const Eigen::VectorXd& residuals,
		    double totalSumOfSquares,
		    double centeredTotalSumOfSquares,
		    bool hasIntercept);

    const Eigen::VectorXd& getCoefficients() const
    {
      return mCoefficients;
    }

    const Eigen::VectorXd& getStandardErrors() const
    {
      return mStandardErrors;
    }

    const Eigen::VectorXd& getResiduals() const
    {
      return mResiduals;
    }

    double getCoefficient(Eigen::Index i) const
    {
      return mCoefficients(i);
    }

    double getStandardError(Eigen::Index i) const
    {
      return mStandardErrors(i);
    }

    double getTValue(Eigen::Index i) const
    {
      return mCoefficients(i) / mStandardErrors(i);
    }

    // Two sided p-value of the t statistic of coefficient i
    double getPValue(Eigen::Index i) const;

    long getNumObservations() const
    {
      return static_cast<long>(mResiduals.size());
    }

    long getNumParameters() const
    {
      return static_cast<long>(mCoefficients.size());
    }

    long getResidualDegreesOfFreedom() const
    {
      return getNumObservations() - getNumParameters();
    }

    double getSumSquaredResiduals() const
    {
      return mSumSquaredResiduals;
    }

    // ssr / residual degrees of freedom, NaN when there are none
    double getResidualVariance() const;

    // Centered when the model has an intercept, uncentered otherwise
    double getRSquared() const;
    double getAdjustedRSquared() const;

    double getLogLikelihood() const;
    double getAic() const;
    double getBic() const;

    bool hasIntercept() const
    {
      return mHasIntercept;
    }

  private:
    Eigen::VectorXd mCoefficients;
    Eigen::VectorXd mStandardErrors;
    Eigen::VectorXd mResiduals;
    double mSumSquaredResiduals;
    double mTotalSumOfSquares;
    double mCenteredTotalSumOfSquares;
    bool mHasIntercept;
  };

  /**
   * @brief Fits y on the columns of X by ordinary least squares.
   *
   * hasIntercept tells the fit that one column of X is a constant; it only
   * affects R-squared.
   *
   * @throws DataInsufficiencyException if X has fewer rows than columns, no
   * rows at all, or linearly dependent columns.
   */
  LeastSquaresFit fitLeastSquares(const Eigen::MatrixXd& X,
				  const Eigen::VectorXd& y,
				  bool hasIntercept = false);
}

#endif
