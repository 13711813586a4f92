#pragma once

#include <cstddef>    // for std::size_t
#include <vector>     // for std::vector
#include <future>     // for std::future
#include <algorithm>  // for std::min, std::max
#include "IParallelExecutor.h"

namespace concurrency {

  // Split [0…total) into at most exec.concurrencyLevel() chunks of at least
  // minChunk indices each, submit each chunk to exec.submit, waitAll, and
  // internally loop p from chunk start to chunk end calling body(p).
  // With a single-threaded executor the whole range runs as one inline chunk.
  template<typename Body>
  void parallel_for(std::size_t total, IParallelExecutor& exec, Body body, std::size_t minChunk = 1)
  {
    if (total == 0) return;

    const std::size_t numTasks = std::max<std::size_t>(exec.concurrencyLevel(), 1);
    std::size_t chunkSize = (total + numTasks - 1) / numTasks; // ceil-divide
    chunkSize = std::max(chunkSize, std::max<std::size_t>(minChunk, 1));

    if (chunkSize >= total)
      {
	for (std::size_t p = 0; p < total; ++p)
	  body(p);
	return;
      }

    std::vector<std::future<void>> futures;
    for (std::size_t start = 0; start < total; start += chunkSize)
      {
	std::size_t end = std::min(total, start + chunkSize);
	futures.emplace_back(exec.submit([=]() {
	  for (std::size_t p = start; p < end; ++p) {
	    body(p);
	  }
	}));
      }
    exec.waitAll(futures);
  }
}
