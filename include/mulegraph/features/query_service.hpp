#ifndef MULEGRAPH_FEATURES_QUERY_SERVICE_HPP_
#define MULEGRAPH_FEATURES_QUERY_SERVICE_HPP_

#include "mulegraph/features/feature_store.hpp"
#include "mulegraph/graph/proximity_engine.hpp"
#include "mulegraph/graph_store.hpp"
#include "mulegraph/observability/metrics.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mulegraph {
namespace features {

/**
 * Features of one party of a transaction as served to the caller.
 */
struct AccountView {
  std::string account_number;
  // False when the account is absent from the snapshot and the graph store
  bool found = false;
  AccountFeatures features;
  bool fresh_diversity = false;
  bool fresh_proximity = false;
};

/**
 * Risk flags derived from both parties' features.
 */
struct RiskAssessment {
  bool density_risk = false;
  bool low_diversity_risk = false;
  bool concentration_risk = false;
  bool proximity_risk = false;
  bool confirmed_mule_party = false;
  std::vector<std::string> risk_factors;
  std::string recommendation;  // "BLOCK", "REVIEW", "MONITOR", "ALLOW"

  bool isHighRisk() const { return density_risk || low_diversity_risk || proximity_risk; }
};

struct TransactionEvaluation {
  std::uint64_t generation = 0;
  AccountView source;
  AccountView target;
  RiskAssessment risk;

  nlohmann::ordered_json toJson() const;
};

/**
 * Real-time evaluation of a source/target pair.
 *
 * Reads the current feature snapshot without blocking batches. Diversity and
 * proximity can be recomputed per request from the graph store instead of
 * served from the snapshot. Unknown accounts and stale groups produce unset
 * features, never an error. If the graph store cannot be read, the request is
 * answered from the snapshot alone.
 */
class QueryService {
 public:
  struct Config {
    bool fresh_diversity = true;
    bool fresh_proximity = false;

    double density_threshold = 0.2;
    double diversity_ratio_threshold = 0.1;
    std::size_t min_transactions_for_diversity = 50;
    double concentration_threshold = 0.5;
    std::size_t proximity_hops_threshold = 2;

    graph::ProximityEngine::Config proximity;
  };

  QueryService(const FeatureStore& feature_store, GraphStore& graph_store);
  QueryService(const FeatureStore& feature_store, GraphStore& graph_store, const Config& config,
               observability::MetricsCollector& metrics = observability::getGlobalMetrics());

  TransactionEvaluation evaluateTransaction(const std::string& source_account,
                                            const std::string& target_account) const;

  static RiskAssessment assessRisk(const AccountView& source, const AccountView& target,
                                   const Config& config);

  const Config& config() const { return config_; }

 private:
  struct GraphData;

  AccountView lookup(const FeatureSnapshot& snapshot, const std::string& account_number,
                     GraphData& data) const;
  void refresh(AccountView& view, GraphData& data) const;

  const FeatureStore& feature_store_;
  GraphStore& graph_store_;
  Config config_;
  observability::MetricsCollector& metrics_;
};

}  // namespace features
}  // namespace mulegraph

#endif  // MULEGRAPH_FEATURES_QUERY_SERVICE_HPP_
