#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <unistd.h>
#include "TestUtils.h"

using namespace boost::gregorian;
using namespace boost::posix_time;

std::vector<double> makeAutoregressiveSeries(std::uint64_t seed, std::size_t length, double phi)
{
  TestLcg generator(seed);
  std::vector<double> series;
  series.reserve(length);

  if (length == 0)
    return series;

  series.push_back(0.0);
  while (series.size() < length)
    series.push_back(phi * series.back() + (generator.next() - 0.5));

  return series;
}

std::vector<ptime> makeDailyDateTimes(std::size_t length)
{
  std::vector<ptime> dateTimes;
  dateTimes.reserve(length);

  ptime start(date(2024, Jan, 1));
  for (std::size_t i = 0; i < length; ++i)
    dateTimes.push_back(start + hours(24 * static_cast<long>(i)));

  return dateTimes;
}

statarb::NumericSeries makeDailySeries(const std::vector<double>& values)
{
  return statarb::NumericSeries(makeDailyDateTimes(values.size()), values);
}

std::string writeTemporaryFile(const std::string& contents, const std::string& prefix)
{
  std::string pathTemplate = "/tmp/" + prefix + "_XXXXXX";
  std::vector<char> path(pathTemplate.begin(), pathTemplate.end());
  path.push_back('\0');

  int fd = mkstemp(path.data());
  if (fd == -1)
    throw std::runtime_error("writeTemporaryFile: unable to create temporary file");

  ssize_t written = write(fd, contents.data(), contents.size());
  close(fd);

  if (written != static_cast<ssize_t>(contents.size()))
    throw std::runtime_error("writeTemporaryFile: short write to " + std::string(path.data()));

  return std::string(path.data());
}
