#include "mulegraph/features/feature_store.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/observability/logger.hpp"
#include "mulegraph/observability/metrics.hpp"

#include <mutex>

namespace mulegraph {
namespace features {

FeatureStore::FeatureStore() : FeatureStore(Config{}) {}

FeatureStore::FeatureStore(const Config& config)
    : config_(config),
      current_(std::make_shared<const FeatureSnapshot>()),
      next_generation_(1) {
}

std::shared_ptr<const FeatureSnapshot> FeatureStore::current() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return current_;
}

std::uint64_t FeatureStore::publish(std::shared_ptr<FeatureSnapshot> snapshot) {
  if (!snapshot) {
    throw MuleGraphError("Cannot publish an empty snapshot pointer");
  }

  std::uint64_t generation;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    generation = next_generation_++;
    snapshot->generation_ = generation;
    current_ = std::move(snapshot);
  }

  observability::getGlobalMetrics().setGauge("mulegraph_feature_generation",
                                             static_cast<double>(generation));
  LOG_BUILDER(observability::LogLevel::INFO, "Published feature snapshot")
      .field("generation", static_cast<std::uint64_t>(generation));
  return generation;
}

std::uint64_t FeatureStore::generation() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return current_->generation();
}

bool FeatureStore::isStale(const FeatureSnapshot& snapshot, FeatureGroup group,
                           FeatureSnapshot::Clock::time_point now) const {
  auto computed = snapshot.computedAt(group);
  if (!computed) return true;
  if (config_.max_feature_age.count() == 0) return false;
  return now - *computed > config_.max_feature_age;
}

}  // namespace features
}  // namespace mulegraph
