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

    // Number of tasks that may run at once; sizes the chunks of parallel_for.
    virtual std::size_t concurrencyLevel() const = 0;

    // Wait on every future, then rethrow the first stored exception (if any).
    virtual void waitAll(std::vector<std::future<void>>& futures) {
      std::exception_ptr firstError;
      for (auto& f : futures) {
        try {
          f.get();
        } catch (...) {
          if (!firstError)
            firstError = std::current_exception();
        }
      }
      if (firstError)
        std::rethrow_exception(firstError);
    }
  };
}
