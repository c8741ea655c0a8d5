// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <future>
#include <set>
#include <boost/format.hpp>
#include "MultiWindowRunner.h"
#include "ParallelExecutors.h"
#include "StatArbException.h"

namespace statarb
{
  MultiWindowRunner::MultiWindowRunner(double numStd,
				       double fee,
				       std::shared_ptr<concurrency::IParallelExecutor> executor,
				       std::ostream* diagnostics)
    : mBacktester(numStd, fee),
      mExecutor(executor ? executor : std::make_shared<concurrency::SingleThreadExecutor>()),
      mDiagnostics(diagnostics)
  {}

  std::map<unsigned int, BacktestResult>
  MultiWindowRunner::run(const NumericSeries& spread,
			 const std::vector<unsigned int>& windows) const
  {
    std::set<unsigned int> distinctWindows;
    for (unsigned int window : windows)
      {
	if (window == 0)
	  throw ConfigurationException("MultiWindowRunner::run - window must be at least 1");

	distinctWindows.insert(window);
      }

    std::map<unsigned int, BacktestResult> results;
    if (distinctWindows.empty())
      return results;

    const std::vector<unsigned int> orderedWindows(distinctWindows.begin(), distinctWindows.end());

    // Each task writes only its own slot
    std::vector<std::unique_ptr<BacktestResult>> slots(orderedWindows.size());
    std::vector<std::future<void>> futures;
    futures.reserve(orderedWindows.size());

    for (std::size_t i = 0; i < orderedWindows.size(); ++i)
      {
	futures.emplace_back(mExecutor->submit([this, &spread, &orderedWindows, &slots, i]() {
	      slots[i].reset(new BacktestResult(mBacktester.run(spread, orderedWindows[i])));
	    }));
      }

    mExecutor->waitAll(futures);

    for (std::size_t i = 0; i < orderedWindows.size(); ++i)
      {
	const BacktestResult& result = *slots[i];
	if (mDiagnostics)
	  *mDiagnostics << boost::format("MultiWindowRunner: window %1% produced %2% trades, total pnl %3$.4f\n")
	    % orderedWindows[i] % result.getStats().getNumTrades() % result.getStats().getTotalPnl();

	results.emplace(orderedWindows[i], result);
      }

    return results;
  }
}
