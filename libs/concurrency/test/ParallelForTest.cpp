// ParallelForTest.cpp
//
// Unit tests for concurrency::parallel_for:
//  - every index in [0, total) is visited exactly once
//  - chunking honours minChunk and the executor's concurrency level
//  - a range covered by one chunk runs inline on the calling thread
//  - exceptions thrown by the body reach the caller

#include <catch2/catch_test_macros.hpp>
#include "ParallelFor.h"
#include "ParallelExecutors.h"
#include <atomic>
#include <mutex>
#include <numeric>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace concurrency;

TEST_CASE("parallel_for visits every index once", "[parallel_for]")
{
  SECTION("SingleThreadExecutor")
  {
    SingleThreadExecutor executor;
    std::vector<int> results(10, 0);

    parallel_for(10, executor, [&results](std::size_t i) {
      results[i] = static_cast<int>(i * 2);
    });

    for (std::size_t i = 0; i < results.size(); ++i)
      REQUIRE(results[i] == static_cast<int>(i * 2));
  }

  SECTION("ThreadPoolExecutor")
  {
    ThreadPoolExecutor<4> executor;
    std::vector<std::atomic<int>> visited(1000);
    for (auto& v : visited)
      v.store(0);

    parallel_for(1000, executor, [&visited](std::size_t i) {
      visited[i].fetch_add(1, std::memory_order_relaxed);
    });

    for (std::size_t i = 0; i < visited.size(); ++i)
      REQUIRE(visited[i].load() == 1);
  }

  SECTION("Zero iterations")
  {
    ThreadPoolExecutor<2> executor;
    std::atomic<int> counter{0};

    parallel_for(0, executor, [&counter](std::size_t) { counter.fetch_add(1); });

    REQUIRE(counter.load() == 0);
  }

  SECTION("Results match a sequential sum")
  {
    ThreadPoolExecutor<3> executor;
    std::vector<long> values(5000, 0);

    parallel_for(values.size(), executor, [&values](std::size_t i) {
      values[i] = static_cast<long>(i) * 3;
    }, 16);

    const long expected = 3L * (4999L * 5000L / 2);
    REQUIRE(std::accumulate(values.begin(), values.end(), 0L) == expected);
  }
}

TEST_CASE("parallel_for chunking", "[parallel_for][chunking]")
{
  SECTION("Range smaller than minChunk runs inline on the caller")
  {
    ThreadPoolExecutor<4> executor;
    const auto caller = std::this_thread::get_id();
    std::set<std::thread::id> threads;
    std::mutex threadsMutex;

    parallel_for(100, executor, [&](std::size_t) {
      std::lock_guard<std::mutex> lock(threadsMutex);
      threads.insert(std::this_thread::get_id());
    }, 256);

    REQUIRE(threads.size() == 1);
    REQUIRE(*threads.begin() == caller);
  }

  SECTION("Large range is split across workers")
  {
    ThreadPoolExecutor<2> executor;
    const auto caller = std::this_thread::get_id();
    std::atomic<int> onCaller{0};

    parallel_for(1000, executor, [&](std::size_t) {
      if (std::this_thread::get_id() == caller)
	onCaller.fetch_add(1);
    }, 1);

    REQUIRE(onCaller.load() == 0);
  }
}

TEST_CASE("parallel_for propagates body exceptions", "[parallel_for][exception]")
{
  SECTION("Inline chunk")
  {
    SingleThreadExecutor executor;
    REQUIRE_THROWS_AS(parallel_for(10, executor, [](std::size_t i) {
      if (i == 7)
	throw std::runtime_error("bad index");
    }), std::runtime_error);
  }

  SECTION("Pooled chunks")
  {
    ThreadPoolExecutor<4> executor;
    REQUIRE_THROWS_AS(parallel_for(400, executor, [](std::size_t i) {
      if (i == 399)
	throw std::out_of_range("last index");
    }), std::out_of_range);
  }
}
