#include "mulegraph/concurrent/parallel_executor.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mulegraph {
namespace concurrent {

ParallelExecutor::ParallelExecutor(std::size_t num_worker_threads,
                                   std::size_t min_items_per_worker)
    : num_workers_(std::max<std::size_t>(1, num_worker_threads)),
      min_items_per_worker_(std::max<std::size_t>(1, min_items_per_worker)) {
}

void ParallelExecutor::forEachRange(std::size_t count, const RangeFunction& fn) const {
  if (count == 0) return;

  std::size_t workers = std::min(num_workers_, (count + min_items_per_worker_ - 1) /
                                                   min_items_per_worker_);
  if (workers <= 1) {
    fn(0, count);
    return;
  }

  std::size_t chunk = (count + workers - 1) / workers;
  std::vector<std::unique_ptr<std::thread>> threads;
  threads.reserve(workers);
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto join_all = [&threads]() {
    for (auto& thread : threads) {
      if (thread && thread->joinable()) {
        thread->join();
      }
    }
  };

  try {
    for (std::size_t w = 0; w < workers; ++w) {
      std::size_t begin = w * chunk;
      std::size_t end = std::min(count, begin + chunk);
      if (begin >= end) break;

      threads.emplace_back(std::make_unique<std::thread>([&fn, &first_error, &error_mutex, begin, end]() {
        try {
          fn(begin, end);
        } catch (...) {
          std::lock_guard<std::mutex> lock(error_mutex);
          if (!first_error) first_error = std::current_exception();
        }
      }));
    }
  } catch (...) {
    // Workers already running still reference this frame
    join_all();
    throw;
  }

  join_all();

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

}  // namespace concurrent
}  // namespace mulegraph
