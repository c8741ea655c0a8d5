#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace concurrency;

// Helper function to create a simple task that increments a counter
auto createIncrementTask(std::atomic<int>& counter) {
  return [&counter]() { counter.fetch_add(1, std::memory_order_relaxed); };
}

// Helper function to create a task that throws an exception
auto createThrowingTask(const std::string& message) {
  return [message]() { throw std::runtime_error(message); };
}

TEST_CASE("SingleThreadExecutor operations", "[SingleThreadExecutor]")
{
  SingleThreadExecutor executor;
  REQUIRE(executor.getNumThreads() == 1);

  SECTION("Task executes immediately")
  {
    std::atomic<bool> executed{false};
    auto future = executor.submit([&executed]() { executed.store(true); });

    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    REQUIRE(executed.load());
  }

  SECTION("Tasks execute in submission order")
  {
    std::vector<int> results;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 5; ++i)
      futures.push_back(executor.submit([&results, i]() { results.push_back(i); }));

    executor.waitAll(futures);
    REQUIRE(results == std::vector<int>{0, 1, 2, 3, 4});
  }

  SECTION("Exceptions are delivered through the future")
  {
    auto future = executor.submit(createThrowingTask("window failed"));
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }
}

TEST_CASE("ThreadPoolExecutor operations", "[ThreadPoolExecutor]")
{
  SECTION("Runs every submitted task")
  {
    ThreadPoolExecutor executor(4);
    REQUIRE(executor.getNumThreads() == 4);

    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 100; ++i)
      futures.push_back(executor.submit(createIncrementTask(counter)));

    executor.waitAll(futures);
    REQUIRE(counter.load() == 100);
  }

  SECTION("Default size uses the hardware")
  {
    ThreadPoolExecutor executor;
    REQUIRE(executor.getNumThreads() >= 1);
  }

  SECTION("waitAll rethrows a task exception")
  {
    ThreadPoolExecutor executor(2);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    futures.push_back(executor.submit(createIncrementTask(counter)));
    futures.push_back(executor.submit(createThrowingTask("boom")));

    REQUIRE_THROWS_AS(executor.waitAll(futures), std::runtime_error);
  }

  SECTION("waitAll lets slower tasks finish before rethrowing")
  {
    ThreadPoolExecutor executor(2);
    std::atomic<bool> slowTaskDone{false};
    std::vector<std::future<void>> futures;
    futures.push_back(executor.submit(createThrowingTask("first window failed")));
    futures.push_back(executor.submit([&slowTaskDone]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      slowTaskDone.store(true);
    }));

    REQUIRE_THROWS_AS(executor.waitAll(futures), std::runtime_error);
    REQUIRE(slowTaskDone.load());
  }

  SECTION("Destructor drains queued tasks")
  {
    std::atomic<int> counter{0};
    {
      ThreadPoolExecutor executor(2);
      for (int i = 0; i < 20; ++i)
        executor.submit(createIncrementTask(counter));
    }
    REQUIRE(counter.load() == 20);
  }
}

TEST_CASE("makeExecutor chooses the executor type", "[ParallelExecutors]")
{
  REQUIRE(dynamic_cast<SingleThreadExecutor*>(makeExecutor(1).get()) != nullptr);

  auto pool = makeExecutor(3);
  REQUIRE(dynamic_cast<ThreadPoolExecutor*>(pool.get()) != nullptr);
  REQUIRE(pool->getNumThreads() == 3);
}
