#pragma once

#include "IParallelExecutor.h"
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for the per-ranking work inside one MM iteration.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread.
 *  - ThreadPoolExecutor<N>: N worker threads created once per fit and reused by
 *    every iteration of that fit.
 *
 * SingleThreadExecutor is the default. ThreadPoolExecutor pays off for large
 * corpora (many thousands of rankings) where the reversed partial sums of one
 * iteration are worth splitting across cores.
 *
 * Each task writes only to the output slots of its own rankings, so neither
 * executor changes the numerical result of an iteration.
 */
namespace concurrency
{
  class SingleThreadExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      std::promise<void> done;
      std::future<void> result = done.get_future();

      try
	{
	  task();
	  done.set_value();
	}
      catch (...)
	{
	  done.set_exception(std::current_exception());
	}

      return result;
    }

    std::size_t concurrencyLevel() const override
    {
      return 1;
    }
  };

  /**
   * @brief Fixed-size pool of worker threads fed from a FIFO task queue.
   *
   * With N == 0 the pool size is std::thread::hardware_concurrency(), or 2 when
   * that is unknown. The destructor runs every task still queued before joining.
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor
  {
  public:
    ThreadPoolExecutor()
      : mStopping(false)
    {
      const std::size_t numThreads = N > 0 ? N : defaultPoolSize();

      try
	{
	  for (std::size_t i = 0; i < numThreads; ++i)
	    mWorkers.emplace_back([this] { runWorker(); });
	}
      catch (...)
	{
	  shutdown();
	  throw;
	}
    }

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto job = std::make_shared<std::packaged_task<void()>>(std::move(task));
      std::future<void> result = job->get_future();

      {
	std::lock_guard<std::mutex> lock(mQueueMutex);
	if (mStopping)
	  throw std::runtime_error("ThreadPoolExecutor::submit - pool is shutting down");

	mQueue.emplace([job]() { (*job)(); });
      }

      mQueueReady.notify_one();
      return result;
    }

    std::size_t concurrencyLevel() const override
    {
      return mWorkers.size();
    }

  private:
    static std::size_t defaultPoolSize()
    {
      const unsigned int hardware = std::thread::hardware_concurrency();
      return hardware > 0 ? hardware : 2;
    }

    void runWorker()
    {
      for (;;)
	{
	  std::function<void()> job;
	  {
	    std::unique_lock<std::mutex> lock(mQueueMutex);
	    mQueueReady.wait(lock, [this] { return mStopping || !mQueue.empty(); });

	    if (mQueue.empty())
	      return;

	    job = std::move(mQueue.front());
	    mQueue.pop();
	  }

	  job();
	}
    }

    void shutdown()
    {
      {
	std::lock_guard<std::mutex> lock(mQueueMutex);
	mStopping = true;
      }

      mQueueReady.notify_all();
      for (auto& worker : mWorkers)
	{
	  if (worker.joinable())
	    worker.join();
	}
    }

    std::vector<std::thread> mWorkers;
    std::queue<std::function<void()>> mQueue;
    std::mutex mQueueMutex;
    std::condition_variable mQueueReady;
    bool mStopping;
  };
}
