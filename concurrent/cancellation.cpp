#include "mulegraph/concurrent/cancellation.hpp"
#include "mulegraph/errors.hpp"

namespace mulegraph {
namespace concurrent {

void CancellationToken::throwIfCancelled(const std::string& stage) const {
  if (isCancelled()) {
    throw BatchCancelledError(stage);
  }
}

}  // namespace concurrent
}  // namespace mulegraph
