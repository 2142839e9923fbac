#ifndef MULEGRAPH_CONCURRENT_PARALLEL_EXECUTOR_HPP_
#define MULEGRAPH_CONCURRENT_PARALLEL_EXECUTOR_HPP_

#include <cstddef>
#include <functional>

namespace mulegraph {
namespace concurrent {

/**
 * Runs index ranges on a fixed number of worker threads.
 *
 * Every call to forEachRange() is a barrier: it returns only after all
 * workers finished their range. The first exception thrown by a worker is
 * rethrown on the calling thread.
 */
class ParallelExecutor {
 public:
  using RangeFunction = std::function<void(std::size_t begin, std::size_t end)>;

  explicit ParallelExecutor(std::size_t num_worker_threads = 4,
                            std::size_t min_items_per_worker = 256);

  // Non-copyable
  ParallelExecutor(const ParallelExecutor&) = delete;
  ParallelExecutor& operator=(const ParallelExecutor&) = delete;

  /**
   * Splits [0, count) into contiguous ranges and runs fn on each.
   * Small inputs run inline on the calling thread.
   */
  void forEachRange(std::size_t count, const RangeFunction& fn) const;

  std::size_t workerCount() const { return num_workers_; }

 private:
  std::size_t num_workers_;
  std::size_t min_items_per_worker_;
};

}  // namespace concurrent
}  // namespace mulegraph

#endif  // MULEGRAPH_CONCURRENT_PARALLEL_EXECUTOR_HPP_
