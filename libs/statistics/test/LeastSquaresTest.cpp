#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "LeastSquares.h"
#include "StatArbException.h"

using namespace statarb;
using namespace Catch;

namespace
{
  Eigen::MatrixXd makeDesign(const std::vector<double>& x, bool withConstant)
  {
    Eigen::MatrixXd X(x.size(), withConstant ? 2 : 1);
    for (std::size_t i = 0; i < x.size(); ++i)
      {
        Eigen::Index row = static_cast<Eigen::Index>(i);
        if (withConstant)
          {
            X(row, 0) = 1.0;
            X(row, 1) = x[i];
          }
        else
          X(row, 0) = x[i];
      }
    return X;
  }
}

TEST_CASE("fitLeastSquares on three points", "[LeastSquares]")
{
    Eigen::VectorXd y(3);
    y << 1.0, 2.0, 4.0;

    LeastSquaresFit fit = fitLeastSquares(makeDesign({0.0, 1.0, 2.0}, true), y, true);

    REQUIRE(fit.getNumObservations() == 3);
    REQUIRE(fit.getNumParameters() == 2);
    REQUIRE(fit.getResidualDegreesOfFreedom() == 1);
    REQUIRE(fit.hasIntercept());

    REQUIRE(fit.getCoefficient(0) == Approx(5.0 / 6.0));
    REQUIRE(fit.getCoefficient(1) == Approx(1.5));
    REQUIRE(fit.getStandardError(1) == Approx(0.28867513459481287));
    REQUIRE(fit.getTValue(1) == Approx(1.5 / 0.28867513459481287));
    REQUIRE(fit.getSumSquaredResiduals() == Approx(1.0 / 6.0));
    REQUIRE(fit.getResidualVariance() == Approx(1.0 / 6.0));
    REQUIRE(fit.getRSquared() == Approx(0.9642857142857143));
    REQUIRE(fit.getAdjustedRSquared() == Approx(0.9285714285714286));
    REQUIRE(fit.getLogLikelihood() == Approx(0.07874203723022877));
    REQUIRE(fit.getAic() == Approx(3.8425159255395425));
    REQUIRE(fit.getBic() == Approx(2.039740502875762));

    REQUIRE(fit.getResiduals()(0) == Approx(1.0 / 6.0));
    REQUIRE(fit.getResiduals()(1) == Approx(-1.0 / 3.0));

    // t with one degree of freedom: p = 1 - 2 atan(t) / pi
    REQUIRE(fit.getPValue(1) == Approx(0.12103771832367671).epsilon(1e-8));
}

TEST_CASE("fitLeastSquares exact line through the origin", "[LeastSquares]")
{
    Eigen::VectorXd y(4);
    y << 0.0, 2.5, 5.0, 7.5;

    LeastSquaresFit fit = fitLeastSquares(makeDesign({0.0, 1.0, 2.0, 3.0}, false), y);

    REQUIRE(fit.getCoefficient(0) == Approx(2.5));
    REQUIRE(fit.getSumSquaredResiduals() == Approx(0.0).margin(1e-20));
    REQUIRE(fit.getRSquared() == Approx(1.0));
    REQUIRE_FALSE(fit.hasIntercept());
}

TEST_CASE("fitLeastSquares rejects degenerate designs", "[LeastSquares]")
{
    SECTION("Collinear columns")
    {
        Eigen::MatrixXd X(3, 2);
        X << 1.0, 2.0,
             1.0, 2.0,
             1.0, 2.0;
        Eigen::VectorXd y(3);
        y << 1.0, 2.0, 3.0;
        REQUIRE_THROWS_AS(fitLeastSquares(X, y), DataInsufficiencyException);
    }

    SECTION("Fewer rows than columns")
    {
        Eigen::VectorXd y(1);
        y << 1.0;
        REQUIRE_THROWS_AS(fitLeastSquares(makeDesign({1.0}, true), y), DataInsufficiencyException);
    }
}
