#include "mulegraph/features/feature_pipeline.hpp"
#include "mulegraph/concurrent/cancellation.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/graph/density_aggregator.hpp"
#include "mulegraph/graph/diversity_calculator.hpp"
#include "mulegraph/graph/projection_builder.hpp"
#include "mulegraph/observability/logger.hpp"

#include <exception>
#include <memory>

namespace mulegraph {
namespace features {

namespace {

const FeatureGroup kAllGroups[] = {FeatureGroup::COMMUNITY, FeatureGroup::PROXIMITY,
                                   FeatureGroup::DIVERSITY};

std::string stageMetric(const std::string& stage) {
  return "mulegraph_batch_stage_" + stage + "_seconds";
}

}  // namespace

FeaturePipeline::FeaturePipeline(GraphStore& graph_store, FeatureStore& feature_store,
                                 FeatureSnapshotWriter* writer)
    : FeaturePipeline(graph_store, feature_store, Config{}, writer) {}

FeaturePipeline::FeaturePipeline(GraphStore& graph_store, FeatureStore& feature_store,
                                 const Config& config, FeatureSnapshotWriter* writer,
                                 observability::MetricsCollector& metrics)
    : graph_store_(graph_store),
      feature_store_(feature_store),
      config_(config),
      writer_(writer),
      metrics_(metrics),
      executor_(config.worker_threads, config.min_items_per_worker) {
  metrics_.describe("mulegraph_batches_total", "Batch runs that published a snapshot");
  metrics_.describe("mulegraph_batch_failures_total", "Batch runs aborted before publishing");
  metrics_.describe("mulegraph_batch_duration_seconds", "Wall time of a batch run");
}

BatchResult FeaturePipeline::runFullBatch(const concurrent::CancellationToken* cancel) {
  return run("full", {FeatureGroup::COMMUNITY, FeatureGroup::PROXIMITY, FeatureGroup::DIVERSITY},
             cancel);
}

BatchResult FeaturePipeline::runCommunityBatch(const concurrent::CancellationToken* cancel) {
  return run("community", {FeatureGroup::COMMUNITY}, cancel);
}

BatchResult FeaturePipeline::runProximityBatch(const concurrent::CancellationToken* cancel) {
  return run("proximity", {FeatureGroup::PROXIMITY}, cancel);
}

BatchResult FeaturePipeline::runDiversityBatch(const concurrent::CancellationToken* cancel) {
  return run("diversity", {FeatureGroup::DIVERSITY}, cancel);
}

BatchResult FeaturePipeline::run(const std::string& batch_name,
                                 const std::set<FeatureGroup>& groups,
                                 const concurrent::CancellationToken* cancel) {
  observability::MetricsCollector::Timer batch_timer(metrics_,
                                                     "mulegraph_batch_duration_seconds");
  BatchResult result;
  std::shared_ptr<const FeatureSnapshot> published;

  LOG_BUILDER(observability::LogLevel::INFO, "Batch started").field("batch", batch_name);

  try {
    result.snapshot_version = graph_store_.snapshotVersion();

    std::vector<Account> accounts;
    std::vector<TransactionEdge> edges;
    graph::ProjectedGraph projected;
    {
      observability::MetricsCollector::Timer timer(metrics_, stageMetric("load"));
      accounts = graph_store_.loadAccounts();
      edges = graph_store_.loadTransactionEdges();
      projected = graph::ProjectionBuilder().build(accounts, edges);
    }
    result.account_count = projected.nodeCount();
    result.projected_edge_count = projected.edges().size();

    // Start from the labels of this batch and the carried-over groups of the
    // current generation
    std::shared_ptr<const FeatureSnapshot> previous = feature_store_.current();
    std::vector<AccountFeatures> rows;
    rows.reserve(projected.nodeCount());
    for (const auto& account : projected.accounts()) {
      AccountFeatures row(account);
      if (const AccountFeatures* old = previous->find(account.id)) {
        for (FeatureGroup group : kAllGroups) {
          if (!groups.count(group)) row.copyGroup(group, *old);
        }
      }
      rows.push_back(std::move(row));
    }

    std::vector<graph::CommunityDensity> communities = previous->communities();

    if (groups.count(FeatureGroup::COMMUNITY)) {
      concurrent::checkCancelled(cancel, "community detection");
      observability::MetricsCollector::Timer timer(metrics_, stageMetric("community"));

      graph::CommunityDetector detector(config_.community);
      graph::CommunityAssignment assignment = detector.detect(projected, cancel);
      graph::DensityResult density = graph::DensityAggregator().aggregate(projected, assignment);

      for (std::size_t node = 0; node < rows.size(); ++node) {
        const graph::CommunityDensity& c = density.by_account.at(rows[node].account_id);
        rows[node].community_id = c.community_id;
        rows[node].community_size = c.community_size;
        rows[node].mule_count = c.mule_count;
        rows[node].mule_density = c.mule_density;
      }
      communities = std::move(density.communities);

      result.community_count = assignment.community_count;
      result.modularity = assignment.modularity;
      result.converged = assignment.converged;
      if (!assignment.converged) {
        result.warnings.push_back("ConvergenceNotReached: community detection stopped after " +
                                  std::to_string(assignment.levels) + " levels");
      }
      metrics_.setGauge("mulegraph_community_count",
                        static_cast<double>(assignment.community_count));
    }

    if (groups.count(FeatureGroup::PROXIMITY)) {
      concurrent::checkCancelled(cancel, "proximity search");
      observability::MetricsCollector::Timer timer(metrics_, stageMetric("proximity"));

      std::vector<AccountId> mules = graph::ProximityEngine::confirmedMules(projected);
      graph::ProximityEngine engine(config_.proximity, &executor_);
      auto records = engine.computeAll(projected, mules, cancel);

      for (auto& row : rows) {
        graph::ProximityRecord& record = records.at(row.account_id);
        if (!record.reached()) continue;
        row.distance_to_mule = record.distance;
        row.nearest_mule_id = record.nearest_mule_id;
        row.nearest_mule = record.nearest_mule;
        row.tied_mules = std::move(record.tied_mules);
        if (config_.proximity.build_paths) row.mule_path = std::move(record.path);
        result.reached_accounts += 1;
      }
      result.mule_count = mules.size();
      metrics_.setGauge("mulegraph_proximity_reached_accounts",
                        static_cast<double>(result.reached_accounts));
    }

    if (groups.count(FeatureGroup::DIVERSITY)) {
      concurrent::checkCancelled(cancel, "diversity");
      observability::MetricsCollector::Timer timer(metrics_, stageMetric("diversity"));

      graph::DiversityCalculator calculator(&executor_);
      auto diversity = calculator.computeAll(projected.accounts(), edges, cancel);
      for (auto& row : rows) {
        const graph::DiversityMetrics& m = diversity.at(row.account_id);
        row.unique_counterparties = m.unique_counterparties;
        row.total_transactions = m.total_transactions;
        row.diversity_ratio = m.diversity_ratio;
        row.top_counterparty_share = m.top_counterparty_share;
      }
    }

    concurrent::checkCancelled(cancel, "publish");

    std::string end_version = graph_store_.snapshotVersion();
    if (end_version != result.snapshot_version) {
      throw ConcurrentMutationConflict(result.snapshot_version, end_version);
    }

    auto snapshot = std::make_shared<FeatureSnapshot>(std::move(rows));
    snapshot->setCommunities(std::move(communities));
    auto now = FeatureSnapshot::Clock::now();
    for (FeatureGroup group : kAllGroups) {
      if (groups.count(group)) {
        snapshot->setComputedAt(group, now);
      } else if (auto when = previous->computedAt(group)) {
        snapshot->setComputedAt(group, *when);
      }
    }

    published = snapshot;
    result.generation = feature_store_.publish(std::move(snapshot));
  } catch (const std::exception& e) {
    metrics_.incrementCounter("mulegraph_batch_failures_total");
    LOG_BUILDER(observability::LogLevel::ERROR, "Batch aborted")
        .field("batch", batch_name)
        .field("error", e.what());
    throw;
  }

  if (writer_) {
    try {
      writer_->commitFeatureSnapshot(*published);
      result.persisted = true;
    } catch (const PersistenceError& e) {
      result.warnings.push_back(std::string("Snapshot not persisted: ") + e.what());
      LOG_BUILDER(observability::LogLevel::ERROR, "Feature snapshot commit failed")
          .field("generation", static_cast<std::uint64_t>(result.generation))
          .field("error", e.what());
    }
  }

  for (const auto& warning : result.warnings) {
    LOG_BUILDER(observability::LogLevel::WARN, warning).field("batch", batch_name);
  }

  metrics_.incrementCounter("mulegraph_batches_total");
  result.duration_seconds = batch_timer.elapsedSeconds();

  LOG_BUILDER(observability::LogLevel::INFO, "Batch finished")
      .field("batch", batch_name)
      .field("generation", static_cast<std::uint64_t>(result.generation))
      .field("accounts", static_cast<std::uint64_t>(result.account_count))
      .field("communities", static_cast<std::uint64_t>(result.community_count))
      .field("reached_accounts", static_cast<std::uint64_t>(result.reached_accounts))
      .field("converged", result.converged)
      .field("persisted", result.persisted)
      .field("duration_seconds", result.duration_seconds);
  return result;
}

}  // namespace features
}  // namespace mulegraph
