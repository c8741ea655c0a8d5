// concurrency/IParallelExecutor.h
#pragma once
#include <future>
#include <vector>
#include <functional>

namespace concurrency
{
  class IParallelExecutor {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; returns a std::future you can wait on.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Number of tasks that may run at the same time
    virtual std::size_t getNumThreads() const = 0;

    // Wait until every task has finished, then rethrow the first task
    // exception. Tasks may reference caller locals, so nothing is rethrown
    // while another task is still running.
    virtual void waitAll(std::vector<std::future<void>>& futures) {
      for (auto& f : futures) f.wait();
      for (auto& f : futures) f.get();
    }
  };
} // namespace concurrency
