#ifndef MULEGRAPH_ERRORS_HPP_
#define MULEGRAPH_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace mulegraph {

class MuleGraphError : public std::runtime_error {
 public:
  explicit MuleGraphError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Malformed input or a dangling account reference while building the projection.
 * Fatal to the running batch; the previous snapshot stays live.
 */
class GraphLoadError : public MuleGraphError {
 public:
  explicit GraphLoadError(const std::string& message) : MuleGraphError(message) {}
};

/**
 * Lookup of an account that is not part of the current feature snapshot.
 */
class UnknownAccountError : public MuleGraphError {
 public:
  explicit UnknownAccountError(const std::string& account)
      : MuleGraphError("Unknown account: " + account), account_(account) {}

  const std::string& account() const { return account_; }

 private:
  std::string account_;
};

/**
 * The graph store changed between the start and the end of a batch.
 */
class ConcurrentMutationConflict : public MuleGraphError {
 public:
  ConcurrentMutationConflict(const std::string& expected, const std::string& actual)
      : MuleGraphError("Graph snapshot changed during batch: expected version " +
                       expected + ", found " + actual) {}
};

class BatchCancelledError : public MuleGraphError {
 public:
  explicit BatchCancelledError(const std::string& stage)
      : MuleGraphError("Batch cancelled during " + stage) {}
};

class ConfigError : public MuleGraphError {
 public:
  explicit ConfigError(const std::string& message) : MuleGraphError(message) {}
};

class PersistenceError : public MuleGraphError {
 public:
  explicit PersistenceError(const std::string& message) : MuleGraphError(message) {}
};

}  // namespace mulegraph

#endif  // MULEGRAPH_ERRORS_HPP_
