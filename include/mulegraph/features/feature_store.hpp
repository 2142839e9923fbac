#ifndef MULEGRAPH_FEATURES_FEATURE_STORE_HPP_
#define MULEGRAPH_FEATURES_FEATURE_STORE_HPP_

#include "mulegraph/features/account_features.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>

namespace mulegraph {
namespace features {

/**
 * Holds the latest published FeatureSnapshot.
 *
 * Readers take a shared_ptr to the current snapshot and keep using it while
 * newer generations are published; a snapshot is never modified once
 * published.
 */
class FeatureStore {
 public:
  struct Config {
    // Zero disables staleness checks
    std::chrono::seconds max_feature_age{0};
  };

  FeatureStore();
  explicit FeatureStore(const Config& config);

  // Non-copyable
  FeatureStore(const FeatureStore&) = delete;
  FeatureStore& operator=(const FeatureStore&) = delete;

  std::shared_ptr<const FeatureSnapshot> current() const;

  /**
   * Stamps the snapshot with the next generation and makes it current.
   * Returns the assigned generation.
   */
  std::uint64_t publish(std::shared_ptr<FeatureSnapshot> snapshot);

  std::uint64_t generation() const;

  /**
   * A group is stale if it was never computed in the snapshot or is older
   * than max_feature_age.
   */
  bool isStale(const FeatureSnapshot& snapshot, FeatureGroup group,
               FeatureSnapshot::Clock::time_point now = FeatureSnapshot::Clock::now()) const;

  const Config& config() const { return config_; }

 private:
  Config config_;
  std::shared_ptr<const FeatureSnapshot> current_;
  std::uint64_t next_generation_;
  mutable std::shared_mutex mutex_;
};

}  // namespace features
}  // namespace mulegraph

#endif  // MULEGRAPH_FEATURES_FEATURE_STORE_HPP_
