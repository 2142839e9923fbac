#include "mulegraph/features/query_service.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/features/feature_codec.hpp"
#include "mulegraph/graph/diversity_calculator.hpp"
#include "mulegraph/graph/projection_builder.hpp"
#include "mulegraph/observability/logger.hpp"

#include <memory>
#include <optional>

namespace mulegraph {
namespace features {

// Graph data loaded lazily, at most once per request
struct QueryService::GraphData {
  GraphStore& store;
  bool loaded = false;
  bool unavailable = false;
  std::vector<Account> accounts;
  std::vector<TransactionEdge> edges;
  std::unique_ptr<graph::ProjectedGraph> projection;

  explicit GraphData(GraphStore& graph_store) : store(graph_store) {}

  void load() {
    if (loaded) return;
    accounts = store.loadAccounts();
    edges = store.loadTransactionEdges();
    loaded = true;
  }

  const Account* findAccount(const std::string& account_number) {
    load();
    for (const auto& account : accounts) {
      if (account.account_number == account_number) return &account;
    }
    return nullptr;
  }

  const graph::ProjectedGraph& projected() {
    if (!projection) {
      load();
      projection = std::make_unique<graph::ProjectedGraph>(
          graph::ProjectionBuilder().build(accounts, edges));
    }
    return *projection;
  }
};

QueryService::QueryService(const FeatureStore& feature_store, GraphStore& graph_store)
    : QueryService(feature_store, graph_store, Config{}) {}

QueryService::QueryService(const FeatureStore& feature_store, GraphStore& graph_store,
                           const Config& config, observability::MetricsCollector& metrics)
    : feature_store_(feature_store),
      graph_store_(graph_store),
      config_(config),
      metrics_(metrics) {
}

TransactionEvaluation QueryService::evaluateTransaction(const std::string& source_account,
                                                        const std::string& target_account) const {
  observability::MetricsCollector::Timer timer(metrics_, "mulegraph_query_duration_seconds");
  metrics_.incrementCounter("mulegraph_query_evaluations_total");

  std::shared_ptr<const FeatureSnapshot> snapshot = feature_store_.current();
  GraphData data(graph_store_);

  TransactionEvaluation evaluation;
  evaluation.generation = snapshot->generation();
  evaluation.source = lookup(*snapshot, source_account, data);
  evaluation.target = lookup(*snapshot, target_account, data);
  evaluation.risk = assessRisk(evaluation.source, evaluation.target, config_);

  LOG_BUILDER(observability::LogLevel::DEBUG, "Transaction evaluated")
      .field("source", source_account)
      .field("target", target_account)
      .field("generation", static_cast<std::uint64_t>(evaluation.generation))
      .field("recommendation", evaluation.risk.recommendation);
  return evaluation;
}

AccountView QueryService::lookup(const FeatureSnapshot& snapshot,
                                 const std::string& account_number, GraphData& data) const {
  AccountView view;
  view.account_number = account_number;

  try {
    view.features = snapshot.get(account_number);
    view.found = true;
    for (FeatureGroup group :
         {FeatureGroup::COMMUNITY, FeatureGroup::PROXIMITY, FeatureGroup::DIVERSITY}) {
      if (feature_store_.isStale(snapshot, group)) view.features.clearGroup(group);
    }
  } catch (const UnknownAccountError& e) {
    metrics_.incrementCounter("mulegraph_query_unknown_accounts_total");
    LOG_BUILDER(observability::LogLevel::DEBUG, "Account not in feature snapshot")
        .field("account", e.account())
        .field("generation", static_cast<std::uint64_t>(snapshot.generation()));
  }

  if (!config_.fresh_diversity && !config_.fresh_proximity) return view;
  if (data.unavailable) return view;

  AccountView fresh = view;
  try {
    refresh(fresh, data);
  } catch (const PersistenceError& e) {
    data.unavailable = true;
    metrics_.incrementCounter("mulegraph_query_graph_unavailable_total");
    LOG_BUILDER(observability::LogLevel::WARN, "Graph store unavailable, serving snapshot")
        .field("account", account_number)
        .field("error", e.what());
    return view;
  } catch (const GraphLoadError& e) {
    data.unavailable = true;
    metrics_.incrementCounter("mulegraph_query_graph_unavailable_total");
    LOG_BUILDER(observability::LogLevel::WARN, "Graph projection failed, serving snapshot")
        .field("account", account_number)
        .field("error", e.what());
    return view;
  }
  return fresh;
}

void QueryService::refresh(AccountView& view, GraphData& data) const {
  // Accounts created after the last batch are still served fresh features
  const Account* account = data.findAccount(view.account_number);
  if (!account) return;
  if (!view.found) {
    view.features = AccountFeatures(*account);
    view.found = true;
  }

  if (config_.fresh_diversity) {
    graph::DiversityMetrics m =
        graph::DiversityCalculator().computeForAccount(data.edges, account->id);
    view.features.unique_counterparties = m.unique_counterparties;
    view.features.total_transactions = m.total_transactions;
    view.features.diversity_ratio = m.diversity_ratio;
    view.features.top_counterparty_share = m.top_counterparty_share;
    view.fresh_diversity = true;
  }

  if (config_.fresh_proximity) {
    const graph::ProjectedGraph& projected = data.projected();
    graph::ProximityEngine engine(config_.proximity);
    graph::ProximityRecord record = engine.computeForAccount(
        projected, graph::ProximityEngine::confirmedMules(projected), account->id);
    view.features.clearGroup(FeatureGroup::PROXIMITY);
    if (record.reached()) {
      view.features.distance_to_mule = record.distance;
      view.features.nearest_mule_id = record.nearest_mule_id;
      view.features.nearest_mule = record.nearest_mule;
      view.features.tied_mules = record.tied_mules;
      if (config_.proximity.build_paths) view.features.mule_path = record.path;
    }
    view.fresh_proximity = true;
  }
}

RiskAssessment QueryService::assessRisk(const AccountView& source, const AccountView& target,
                                        const Config& config) {
  RiskAssessment risk;

  struct Party {
    const char* name;
    const AccountFeatures& features;
    bool density = false;
    bool proximity = false;
  };
  Party parties[] = {{"Source", source.features}, {"Target", target.features}};

  for (auto& party : parties) {
    const AccountFeatures& f = party.features;
    std::string name = party.name;

    if (f.confirmed_mule) {
      risk.confirmed_mule_party = true;
      risk.risk_factors.push_back(name + " account is a confirmed mule");
    }
    if (f.mule_density && *f.mule_density > config.density_threshold) {
      party.density = true;
      risk.density_risk = true;
      risk.risk_factors.push_back(name + " account in suspicious community");
    }
    if (f.diversity_ratio && f.total_transactions &&
        *f.total_transactions > config.min_transactions_for_diversity &&
        *f.diversity_ratio < config.diversity_ratio_threshold) {
      risk.low_diversity_risk = true;
      risk.risk_factors.push_back(name + " account has low counterparty diversity");
    }
    if (f.top_counterparty_share && *f.top_counterparty_share > config.concentration_threshold) {
      risk.concentration_risk = true;
      risk.risk_factors.push_back(name + " account concentrated on one counterparty");
    }
    if (f.distance_to_mule && *f.distance_to_mule <= config.proximity_hops_threshold) {
      party.proximity = true;
      risk.proximity_risk = true;
      risk.risk_factors.push_back(name + " account within " +
                                  std::to_string(*f.distance_to_mule) + " hops of a mule");
    }
  }

  bool source_flagged = parties[0].density || parties[0].proximity;
  bool target_flagged = parties[1].density || parties[1].proximity;

  if (risk.confirmed_mule_party || (source_flagged && target_flagged)) {
    risk.recommendation = "BLOCK";
  } else if (risk.isHighRisk()) {
    risk.recommendation = "REVIEW";
  } else if (risk.concentration_risk) {
    risk.recommendation = "MONITOR";
  } else {
    risk.recommendation = "ALLOW";
  }
  return risk;
}

namespace {

nlohmann::ordered_json viewToJson(const AccountView& view) {
  nlohmann::ordered_json json;
  json["account_number"] = view.account_number;
  json["found"] = view.found;
  json["fresh_diversity"] = view.fresh_diversity;
  json["fresh_proximity"] = view.fresh_proximity;
  json["features"] = view.found ? FeatureCodec::toJson(view.features)
                                : nlohmann::ordered_json(nullptr);
  return json;
}

}  // namespace

nlohmann::ordered_json TransactionEvaluation::toJson() const {
  nlohmann::ordered_json json;
  json["generation"] = generation;
  json["source"] = viewToJson(source);
  json["target"] = viewToJson(target);
  json["risk"] = {{"density_risk", risk.density_risk},
                  {"low_diversity_risk", risk.low_diversity_risk},
                  {"concentration_risk", risk.concentration_risk},
                  {"proximity_risk", risk.proximity_risk},
                  {"confirmed_mule_party", risk.confirmed_mule_party},
                  {"risk_factors", risk.risk_factors},
                  {"recommendation", risk.recommendation}};
  return json;
}

}  // namespace features
}  // namespace mulegraph
