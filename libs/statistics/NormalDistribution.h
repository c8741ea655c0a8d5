// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//
// Standard normal distribution helpers

#pragma once

#include <cmath>

namespace statarb
{
  /**
   * @struct NormalDistribution
   * @brief Utility functions for the standard normal distribution N(0,1).
   */
  struct NormalDistribution
  {
    /**
     * @brief Computes Φ(x) = P(Z ≤ x) where Z ~ N(0,1).
     *
     * Evaluated as 0.5 * erfc(-x / √2), which keeps full relative accuracy
     * in the lower tail where 1 + erf(x / √2) would cancel.
     */
    static inline double standardNormalCdf(double x) noexcept
    {
      constexpr double INV_SQRT2 = 0.7071067811865475244;
      return 0.5 * std::erfc(-x * INV_SQRT2);
    }
  };

} // namespace statarb
