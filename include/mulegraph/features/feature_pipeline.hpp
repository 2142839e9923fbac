#ifndef MULEGRAPH_FEATURES_FEATURE_PIPELINE_HPP_
#define MULEGRAPH_FEATURES_FEATURE_PIPELINE_HPP_

#include "mulegraph/concurrent/parallel_executor.hpp"
#include "mulegraph/features/feature_store.hpp"
#include "mulegraph/features/feature_writer.hpp"
#include "mulegraph/graph/community_detector.hpp"
#include "mulegraph/graph/proximity_engine.hpp"
#include "mulegraph/graph_store.hpp"
#include "mulegraph/observability/metrics.hpp"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace mulegraph {
namespace concurrent {
class CancellationToken;
}  // namespace concurrent

namespace features {

/**
 * Outcome of one batch run.
 */
struct BatchResult {
  std::uint64_t generation = 0;
  std::string snapshot_version;
  std::size_t account_count = 0;
  std::size_t projected_edge_count = 0;
  std::size_t community_count = 0;
  double modularity = 0.0;
  std::size_t mule_count = 0;
  // Accounts with a mule within max_depth hops
  std::size_t reached_accounts = 0;
  bool converged = true;
  bool persisted = false;
  std::vector<std::string> warnings;
  double duration_seconds = 0.0;
};

/**
 * Batch orchestration: load the graph, project it, run the requested feature
 * jobs, and publish a new snapshot.
 *
 * Groups that are not recomputed are carried over from the current snapshot.
 * Nothing is published if any stage throws; the previous generation stays
 * live.
 */
class FeaturePipeline {
 public:
  struct Config {
    graph::CommunityDetector::Config community;
    graph::ProximityEngine::Config proximity;
    std::size_t worker_threads = 4;
    std::size_t min_items_per_worker = 256;
  };

  FeaturePipeline(GraphStore& graph_store, FeatureStore& feature_store,
                  FeatureSnapshotWriter* writer = nullptr);
  FeaturePipeline(GraphStore& graph_store, FeatureStore& feature_store, const Config& config,
                  FeatureSnapshotWriter* writer = nullptr,
                  observability::MetricsCollector& metrics = observability::getGlobalMetrics());

  // Non-copyable
  FeaturePipeline(const FeaturePipeline&) = delete;
  FeaturePipeline& operator=(const FeaturePipeline&) = delete;

  BatchResult runFullBatch(const concurrent::CancellationToken* cancel = nullptr);
  BatchResult runCommunityBatch(const concurrent::CancellationToken* cancel = nullptr);
  BatchResult runProximityBatch(const concurrent::CancellationToken* cancel = nullptr);
  BatchResult runDiversityBatch(const concurrent::CancellationToken* cancel = nullptr);

  const Config& config() const { return config_; }

 private:
  BatchResult run(const std::string& batch_name, const std::set<FeatureGroup>& groups,
                  const concurrent::CancellationToken* cancel);

  GraphStore& graph_store_;
  FeatureStore& feature_store_;
  Config config_;
  FeatureSnapshotWriter* writer_;
  observability::MetricsCollector& metrics_;
  concurrent::ParallelExecutor executor_;
};

}  // namespace features
}  // namespace mulegraph

#endif  // MULEGRAPH_FEATURES_FEATURE_PIPELINE_HPP_
