#ifndef __STATARB_TEST_UTILS_H
#define __STATARB_TEST_UTILS_H 1

#include <cstdint>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "NumericSeries.h"

// Deterministic uniform generator so expected values do not depend on the
// standard library's distributions.
class TestLcg
{
public:
  explicit TestLcg(std::uint64_t seed)
    : mState(seed)
  {}

  // Uniform in [0, 1)
  double next()
  {
    mState = mState * 6364136223846793005ULL + 1442695040888963407ULL;
    return static_cast<double>(mState >> 11) * (1.0 / 9007199254740992.0);
  }

private:
  std::uint64_t mState;
};

// x[0] = 0, x[t] = phi * x[t-1] + (u - 0.5)
std::vector<double> makeAutoregressiveSeries(std::uint64_t seed, std::size_t length, double phi);

// One bar per day starting at 2024-01-01
std::vector<boost::posix_time::ptime> makeDailyDateTimes(std::size_t length);

statarb::NumericSeries makeDailySeries(const std::vector<double>& values);

// Writes contents to a new temporary file and returns its path
std::string writeTemporaryFile(const std::string& contents, const std::string& prefix = "statarb");

#endif
