// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_MACKINNON_H
#define __STATARB_MACKINNON_H 1

#include <map>
#include <string>

namespace statarb
{
  // Deterministic terms in a Dickey-Fuller regression
  enum class DeterministicTerms {NoConstant, Constant, ConstantTrend};

  // Number of deterministic regressors: 0, 1 or 2
  int getNumDeterministicTerms(DeterministicTerms terms);

  std::string toString(DeterministicTerms terms);

  /**
   * @brief Approximate p-value of a Dickey-Fuller t statistic for a single
   * series, from the response surface regressions of MacKinnon (1994).
   */
  double mackinnonPValue(double testStatistic, DeterministicTerms terms);

  /**
   * @brief Dickey-Fuller critical values at 1%, 5% and 10% for a single
   * series and nobs observations, from MacKinnon (2010). Keys are "1%",
   * "5%" and "10%".
   */
  std::map<std::string, double> mackinnonCriticalValues(DeterministicTerms terms, long nobs);
}

#endif
