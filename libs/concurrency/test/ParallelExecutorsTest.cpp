// ParallelExecutorsTest.cpp
//
// Unit tests for the executors that run the per-ranking terms of an MM iteration:
//  - SingleThreadExecutor: inline, ordered, concurrency level 1
//  - ThreadPoolExecutor<N>: fixed pool reused across many submissions
//  - IParallelExecutor::waitAll: waits on every future, rethrows the first error

#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace concurrency;

namespace
{
  auto createIncrementTask(std::atomic<int>& counter) {
    return [&counter]() { counter.fetch_add(1, std::memory_order_relaxed); };
  }

  auto createThrowingTask(const std::string& message) {
    return [message]() { throw std::runtime_error(message); };
  }
}

TEST_CASE("SingleThreadExecutor operations", "[SingleThreadExecutor]")
{
  SingleThreadExecutor executor;

  SECTION("Task has run by the time submit returns")
  {
    std::atomic<bool> executed{false};
    auto future = executor.submit([&executed]() { executed.store(true); });

    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    REQUIRE(executed.load());
  }

  SECTION("Tasks run in submission order")
  {
    std::vector<int> results;
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 5; ++i)
      futures.push_back(executor.submit([&results, i]() { results.push_back(i); }));

    executor.waitAll(futures);

    REQUIRE(results == std::vector<int>{0, 1, 2, 3, 4});
  }

  SECTION("Exception is stored in the future")
  {
    auto future = executor.submit(createThrowingTask("inline failure"));
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }

  SECTION("Concurrency level is one")
  {
    REQUIRE(executor.concurrencyLevel() == 1);
  }
}

TEST_CASE("ThreadPoolExecutor operations", "[ThreadPoolExecutor]")
{
  SECTION("Fixed pool size is reported as the concurrency level")
  {
    ThreadPoolExecutor<3> executor;
    REQUIRE(executor.concurrencyLevel() == 3);
  }

  SECTION("Default pool has at least one worker")
  {
    ThreadPoolExecutor<> executor;
    REQUIRE(executor.concurrencyLevel() >= 1);
  }

  SECTION("All submitted tasks run")
  {
    ThreadPoolExecutor<4> executor;
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 50; ++i)
      futures.push_back(executor.submit(createIncrementTask(counter)));

    executor.waitAll(futures);
    REQUIRE(counter.load() == 50);
  }

  SECTION("Pool is reusable across batches")
  {
    ThreadPoolExecutor<2> executor;
    std::atomic<int> counter{0};

    for (int batch = 0; batch < 10; ++batch)
      {
	std::vector<std::future<void>> futures;
	for (int i = 0; i < 4; ++i)
	  futures.push_back(executor.submit(createIncrementTask(counter)));
	executor.waitAll(futures);
      }

    REQUIRE(counter.load() == 40);
  }

  SECTION("Tasks never exceed the pool size")
  {
    ThreadPoolExecutor<2> executor;
    std::atomic<int> running{0};
    std::atomic<int> maxRunning{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 6; ++i)
      {
	futures.push_back(executor.submit([&running, &maxRunning]() {
	  int current = running.fetch_add(1) + 1;
	  int expected = maxRunning.load();
	  while (expected < current && !maxRunning.compare_exchange_weak(expected, current)) {
	  }
	  std::this_thread::sleep_for(std::chrono::milliseconds(10));
	  running.fetch_sub(1);
	}));
      }

    executor.waitAll(futures);
    REQUIRE(maxRunning.load() <= 2);
  }

  SECTION("Destructor drains queued tasks")
  {
    std::atomic<int> counter{0};
    {
      ThreadPoolExecutor<1> executor;
      for (int i = 0; i < 20; ++i)
	executor.submit(createIncrementTask(counter));
    }

    REQUIRE(counter.load() == 20);
  }
}

TEST_CASE("waitAll rethrows the first failure after waiting on every task", "[IParallelExecutor]")
{
  ThreadPoolExecutor<2> executor;
  std::atomic<int> completed{0};
  std::vector<std::future<void>> futures;

  futures.push_back(executor.submit(createThrowingTask("first")));
  for (int i = 0; i < 8; ++i)
    futures.push_back(executor.submit(createIncrementTask(completed)));
  futures.push_back(executor.submit(createThrowingTask("second")));

  try
    {
      executor.waitAll(futures);
      FAIL("waitAll did not rethrow");
    }
  catch (const std::runtime_error& e)
    {
      REQUIRE(std::string(e.what()) == "first");
    }

  REQUIRE(completed.load() == 8);
}
