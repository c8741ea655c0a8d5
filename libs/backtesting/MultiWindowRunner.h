// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_MULTI_WINDOW_RUNNER_H
#define __STATARB_MULTI_WINDOW_RUNNER_H 1

#include <map>
#include <memory>
#include <ostream>
#include <vector>
#include "BandBacktester.h"
#include "IParallelExecutor.h"
#include "NumericSeries.h"

namespace statarb
{
  //
  // class MultiWindowRunner
  //
  // Backtests one spread over several rolling windows with the same band
  // width and fee. Windows are independent so each one is submitted to the
  // executor as a separate task; the result does not depend on the executor
  // used. A window listed more than once is run once.
  //
  class MultiWindowRunner
  {
  public:
    // A null executor runs the windows on the calling thread
    MultiWindowRunner(double numStd,
		      double fee = 0.0,
		      std::shared_ptr<concurrency::IParallelExecutor> executor = nullptr,
		      std::ostream* diagnostics = nullptr);

    /**
     * @brief Runs every window and returns the results keyed by window.
     *
     * @throws ConfigurationException if any window is zero, before any work is
     * scheduled. Exceptions from a task are rethrown here.
     */
    std::map<unsigned int, BacktestResult> run(const NumericSeries& spread,
					       const std::vector<unsigned int>& windows) const;

    const BandBacktester& getBacktester() const
    {
      return mBacktester;
    }

  private:
    BandBacktester mBacktester;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
    std::ostream* mDiagnostics;
  };
}

#endif
