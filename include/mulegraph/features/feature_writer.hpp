#ifndef MULEGRAPH_FEATURES_FEATURE_WRITER_HPP_
#define MULEGRAPH_FEATURES_FEATURE_WRITER_HPP_

#include "mulegraph/features/account_features.hpp"

namespace mulegraph {
namespace features {

/**
 * Persists published snapshots outside the process.
 * Implementations throw PersistenceError when the commit fails.
 */
class FeatureSnapshotWriter {
 public:
  virtual ~FeatureSnapshotWriter() = default;

  virtual void commitFeatureSnapshot(const FeatureSnapshot& snapshot) = 0;
};

}  // namespace features
}  // namespace mulegraph

#endif  // MULEGRAPH_FEATURES_FEATURE_WRITER_HPP_
