// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <array>
#include <limits>
#include <stdexcept>
#include "MacKinnon.h"
#include "NormalDistribution.h"

namespace statarb
{
  namespace
  {
    struct PValueSurface
    {
      double maxStat;
      double minStat;
      double starStat;
      std::array<double, 3> smallP;
      std::array<double, 4> largeP;
    };

    // MacKinnon (1994) Table 3 and 4 coefficients for one I(1) series,
    // already rescaled.
    const PValueSurface& getPValueSurface(DeterministicTerms terms)
    {
      static const PValueSurface noConstant = {
	std::numeric_limits<double>::infinity(), -19.04, -1.04,
	{{0.6344, 1.2378, 0.032496}},
	{{0.4797, 0.93557, -0.06999, 0.033066}}
      };

      static const PValueSurface constant = {
	2.74, -18.83, -1.61,
	{{2.1659, 1.4412, 0.038269}},
	{{1.7339, 0.93202, -0.12745, -0.010368}}
      };

      static const PValueSurface constantTrend = {
	0.7, -16.18, -2.89,
	{{3.2512, 1.6047, 0.049588}},
	{{2.5261, 0.61654, -0.37956, -0.060285}}
      };

      switch (terms)
	{
	case DeterministicTerms::NoConstant:
	  return noConstant;
	case DeterministicTerms::ConstantTrend:
	  return constantTrend;
	case DeterministicTerms::Constant:
	default:
	  return constant;
	}
    }

    // MacKinnon (2010) response surface: b0 + b1/T + b2/T^2 + b3/T^3
    using CriticalValueRow = std::array<double, 4>;

    const std::array<CriticalValueRow, 3>& getCriticalValueSurface(DeterministicTerms terms)
    {
      static const std::array<CriticalValueRow, 3> noConstant = {{
	  {{-2.56574, -2.2358, -3.627, 0.0}},
	  {{-1.94100, -0.2686, -3.365, 31.223}},
	  {{-1.61682, 0.2656, -2.714, 25.364}}
	}};

      static const std::array<CriticalValueRow, 3> constant = {{
	  {{-3.43035, -6.5393, -16.786, -79.433}},
	  {{-2.86154, -2.8903, -4.234, -40.040}},
	  {{-2.56677, -1.5384, -2.809, 0.0}}
	}};

      static const std::array<CriticalValueRow, 3> constantTrend = {{
	  {{-3.95877, -9.0531, -28.428, -134.155}},
	  {{-3.41049, -4.3904, -9.036, -45.374}},
	  {{-3.12705, -2.5856, -3.925, -22.380}}
	}};

      switch (terms)
	{
	case DeterministicTerms::NoConstant:
	  return noConstant;
	case DeterministicTerms::ConstantTrend:
	  return constantTrend;
	case DeterministicTerms::Constant:
	default:
	  return constant;
	}
    }

    template <std::size_t N>
    double evaluatePolynomial(const std::array<double, N>& coefficients, double x)
    {
      // Horner, lowest order coefficient first
      double result = 0.0;
      for (std::size_t i = N; i-- > 0;)
	result = result * x + coefficients[i];

      return result;
    }
  }

  int getNumDeterministicTerms(DeterministicTerms terms)
  {
    switch (terms)
      {
      case DeterministicTerms::NoConstant:
	return 0;
      case DeterministicTerms::ConstantTrend:
	return 2;
      case DeterministicTerms::Constant:
      default:
	return 1;
      }
  }

  std::string toString(DeterministicTerms terms)
  {
    switch (terms)
      {
      case DeterministicTerms::NoConstant:
	return "n";
      case DeterministicTerms::ConstantTrend:
	return "ct";
      case DeterministicTerms::Constant:
      default:
	return "c";
      }
  }

  double mackinnonPValue(double testStatistic, DeterministicTerms terms)
  {
    const PValueSurface& surface = getPValueSurface(terms);

    if (testStatistic > surface.maxStat)
      return 1.0;
    else if (testStatistic < surface.minStat)
      return 0.0;

    if (testStatistic <= surface.starStat)
      return NormalDistribution::standardNormalCdf(evaluatePolynomial(surface.smallP, testStatistic));

    return NormalDistribution::standardNormalCdf(evaluatePolynomial(surface.largeP, testStatistic));
  }

  std::map<std::string, double> mackinnonCriticalValues(DeterministicTerms terms, long nobs)
  {
    if (nobs <= 0)
      throw std::invalid_argument("mackinnonCriticalValues: number of observations must be positive");

    static const char* const labels[] = {"1%", "5%", "10%"};
    const double inverseT = 1.0 / static_cast<double>(nobs);
    const std::array<CriticalValueRow, 3>& surface = getCriticalValueSurface(terms);

    std::map<std::string, double> criticalValues;
    for (std::size_t i = 0; i < surface.size(); ++i)
      criticalValues[labels[i]] = evaluatePolynomial(surface[i], inverseT);

    return criticalValues;
  }
}
