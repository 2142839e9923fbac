#ifndef MULEGRAPH_CONCURRENT_CANCELLATION_HPP_
#define MULEGRAPH_CONCURRENT_CANCELLATION_HPP_

#include <atomic>
#include <string>

namespace mulegraph {
namespace concurrent {

/**
 * Cooperative cancellation flag shared between a batch and its controller.
 */
class CancellationToken {
 public:
  CancellationToken() : cancelled_(false) {}

  void cancel() { cancelled_.store(true); }
  bool isCancelled() const { return cancelled_.load(); }

  /**
   * Throws BatchCancelledError naming the stage if cancellation was requested.
   */
  void throwIfCancelled(const std::string& stage) const;

 private:
  std::atomic<bool> cancelled_;
};

// Null-safe helper for optional tokens
inline void checkCancelled(const CancellationToken* token, const std::string& stage) {
  if (token) token->throwIfCancelled(stage);
}

}  // namespace concurrent
}  // namespace mulegraph

#endif  // MULEGRAPH_CONCURRENT_CANCELLATION_HPP_
