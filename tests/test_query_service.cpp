#include "mulegraph/errors.hpp"
#include "mulegraph/features/feature_pipeline.hpp"
#include "mulegraph/features/query_service.hpp"
#include "mulegraph/in_memory_graph_store.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

using namespace mulegraph;
using namespace mulegraph::features;
using fixtures::account;
using fixtures::transfer;

namespace {

// Mule chain A-B-M plus a clean square D-E-F-G where every account has two
// counterparties.
fixtures::Graph queryGraph() {
  auto g = fixtures::muleChain();
  g.accounts.push_back(account(5, "D"));
  g.accounts.push_back(account(6, "E"));
  g.accounts.push_back(account(7, "F"));
  g.accounts.push_back(account(8, "G"));
  g.edges.push_back(transfer(5, 6, 20.0));
  g.edges.push_back(transfer(6, 7, 20.0));
  g.edges.push_back(transfer(7, 8, 20.0));
  g.edges.push_back(transfer(8, 5, 20.0));
  return g;
}

AccountView view(const std::string& number) {
  AccountView v;
  v.account_number = number;
  v.found = true;
  v.features.account_number = number;
  return v;
}

// Delegates to another store until taken down, then fails every read
class OutageGraphStore : public GraphStore {
 public:
  explicit OutageGraphStore(GraphStore& inner) : inner_(inner) {}

  std::vector<Account> loadAccounts() override {
    if (down) throw PersistenceError("graph store offline");
    return inner_.loadAccounts();
  }
  std::vector<TransactionEdge> loadTransactionEdges() override {
    if (down) throw PersistenceError("graph store offline");
    return inner_.loadTransactionEdges();
  }
  std::string snapshotVersion() override { return inner_.snapshotVersion(); }

  bool down = false;

 private:
  GraphStore& inner_;
};

}  // namespace

class QueryServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto g = queryGraph();
    store_ = std::make_unique<InMemoryGraphStore>(g.accounts, g.edges);
    FeaturePipeline pipeline(*store_, features_, FeaturePipeline::Config{}, nullptr, metrics_);
    pipeline.runFullBatch();
  }

  QueryService::Config snapshotOnly() const {
    QueryService::Config config;
    config.fresh_diversity = false;
    config.fresh_proximity = false;
    return config;
  }

  std::unique_ptr<InMemoryGraphStore> store_;
  FeatureStore features_;
  observability::MetricsCollector metrics_;
};

TEST_F(QueryServiceTest, MuleCounterpartyIsBlocked) {
  QueryService service(features_, *store_, snapshotOnly(), metrics_);
  TransactionEvaluation evaluation = service.evaluateTransaction("A", "M");

  EXPECT_EQ(evaluation.generation, 1u);
  EXPECT_TRUE(evaluation.source.found);
  EXPECT_EQ(evaluation.source.features.distance_to_mule, 2u);
  EXPECT_TRUE(evaluation.risk.confirmed_mule_party);
  EXPECT_TRUE(evaluation.risk.proximity_risk);
  EXPECT_EQ(evaluation.risk.recommendation, "BLOCK");
  EXPECT_FALSE(evaluation.risk.risk_factors.empty());
}

TEST_F(QueryServiceTest, CleanPairIsAllowed) {
  QueryService service(features_, *store_, snapshotOnly(), metrics_);
  TransactionEvaluation evaluation = service.evaluateTransaction("D", "E");

  EXPECT_EQ(evaluation.source.features.mule_density, 0.0);
  EXPECT_FALSE(evaluation.source.features.distance_to_mule.has_value());
  EXPECT_EQ(evaluation.source.features.top_counterparty_share, 0.5);
  EXPECT_EQ(evaluation.risk.recommendation, "ALLOW");
  EXPECT_TRUE(evaluation.risk.risk_factors.empty());
  EXPECT_EQ(metrics_.counterValue("mulegraph_query_evaluations_total"), 1.0);
}

TEST_F(QueryServiceTest, UnknownAccountLeavesFeaturesUnset) {
  QueryService service(features_, *store_, snapshotOnly(), metrics_);
  TransactionEvaluation evaluation = service.evaluateTransaction("D", "NOPE");

  EXPECT_TRUE(evaluation.source.found);
  EXPECT_FALSE(evaluation.target.found);
  EXPECT_FALSE(evaluation.target.features.community_id.has_value());
  EXPECT_FALSE(evaluation.target.features.diversity_ratio.has_value());
  EXPECT_EQ(evaluation.risk.recommendation, "ALLOW");
  EXPECT_EQ(metrics_.counterValue("mulegraph_query_unknown_accounts_total"), 1.0);
}

TEST_F(QueryServiceTest, FreshDiversitySeesTransactionsAfterBatch) {
  for (int i = 0; i < 5; ++i) store_->addTransaction(transfer(5, 7, 1.0));

  QueryService::Config config = snapshotOnly();
  config.fresh_diversity = true;
  QueryService fresh(features_, *store_, config, metrics_);
  QueryService cached(features_, *store_, snapshotOnly(), metrics_);

  TransactionEvaluation now = fresh.evaluateTransaction("D", "E");
  TransactionEvaluation before = cached.evaluateTransaction("D", "E");

  EXPECT_TRUE(now.source.fresh_diversity);
  EXPECT_EQ(now.source.features.total_transactions, 7u);
  EXPECT_EQ(now.source.features.unique_counterparties, 3u);
  EXPECT_EQ(before.source.features.total_transactions, 2u);
  EXPECT_FALSE(before.source.fresh_diversity);
}

TEST_F(QueryServiceTest, FreshFeaturesForAccountsNewerThanSnapshot) {
  store_->addAccount(account(9, "NEW"));
  store_->addTransaction(transfer(9, 4, 3.0));

  QueryService::Config config;
  config.fresh_diversity = true;
  config.fresh_proximity = true;
  QueryService service(features_, *store_, config, metrics_);

  TransactionEvaluation evaluation = service.evaluateTransaction("NEW", "D");

  EXPECT_TRUE(evaluation.source.found);
  EXPECT_FALSE(evaluation.source.features.community_id.has_value());
  EXPECT_EQ(evaluation.source.features.total_transactions, 1u);
  EXPECT_EQ(evaluation.source.features.distance_to_mule, 1u);
  EXPECT_EQ(evaluation.source.features.nearest_mule, std::string("M"));
  EXPECT_TRUE(evaluation.risk.proximity_risk);
  EXPECT_EQ(evaluation.risk.recommendation, "REVIEW");
}

TEST_F(QueryServiceTest, FreshProximityAgreesWithBatch) {
  QueryService::Config config = snapshotOnly();
  config.fresh_proximity = true;
  QueryService fresh(features_, *store_, config, metrics_);

  for (const auto& row : features_.current()->rows()) {
    TransactionEvaluation evaluation = fresh.evaluateTransaction(row.account_number, "D");
    EXPECT_TRUE(evaluation.source.fresh_proximity);
    EXPECT_EQ(evaluation.source.features.distance_to_mule, row.distance_to_mule)
        << row.account_number;
    EXPECT_EQ(evaluation.source.features.nearest_mule, row.nearest_mule) << row.account_number;
    EXPECT_EQ(evaluation.source.features.mule_path, row.mule_path) << row.account_number;
  }
}

TEST_F(QueryServiceTest, GraphStoreOutageServesSnapshot) {
  OutageGraphStore outage(*store_);
  QueryService::Config config;
  config.fresh_diversity = true;
  config.fresh_proximity = true;
  QueryService service(features_, outage, config, metrics_);

  outage.down = true;
  TransactionEvaluation evaluation;
  ASSERT_NO_THROW(evaluation = service.evaluateTransaction("A", "B"));

  EXPECT_TRUE(evaluation.source.found);
  EXPECT_FALSE(evaluation.source.fresh_diversity);
  EXPECT_FALSE(evaluation.source.fresh_proximity);
  EXPECT_EQ(evaluation.source.features.distance_to_mule, 2u);
  EXPECT_EQ(evaluation.target.features.distance_to_mule, 1u);
  EXPECT_EQ(evaluation.source.features.total_transactions, 1u);
  EXPECT_EQ(evaluation.risk.recommendation, "BLOCK");
  EXPECT_EQ(metrics_.counterValue("mulegraph_query_graph_unavailable_total"), 1.0);

  outage.down = false;
  TransactionEvaluation recovered = service.evaluateTransaction("A", "B");
  EXPECT_TRUE(recovered.source.fresh_diversity);
  EXPECT_TRUE(recovered.source.fresh_proximity);
}

TEST_F(QueryServiceTest, StaleGroupsAreNotServed) {
  FeatureStore::Config store_config;
  store_config.max_feature_age = std::chrono::seconds(60);
  FeatureStore aged(store_config);

  AccountFeatures row(account(5, "D"));
  row.community_id = 0;
  row.mule_density = 0.9;
  row.diversity_ratio = 0.5;
  row.total_transactions = 2;
  auto snapshot = std::make_shared<FeatureSnapshot>(std::vector<AccountFeatures>{row});
  auto now = FeatureSnapshot::Clock::now();
  snapshot->setComputedAt(FeatureGroup::COMMUNITY, now - std::chrono::hours(1));
  snapshot->setComputedAt(FeatureGroup::DIVERSITY, now);
  aged.publish(snapshot);

  QueryService service(aged, *store_, snapshotOnly(), metrics_);
  TransactionEvaluation evaluation = service.evaluateTransaction("D", "D");

  EXPECT_TRUE(evaluation.source.found);
  EXPECT_FALSE(evaluation.source.features.community_id.has_value());
  EXPECT_FALSE(evaluation.source.features.mule_density.has_value());
  EXPECT_EQ(evaluation.source.features.diversity_ratio, 0.5);
  EXPECT_FALSE(evaluation.risk.density_risk);
}

TEST_F(QueryServiceTest, EvaluationSerializesToJson) {
  QueryService service(features_, *store_, snapshotOnly(), metrics_);
  auto json = service.evaluateTransaction("A", "NOPE").toJson();

  EXPECT_EQ(json["generation"], 1);
  EXPECT_EQ(json["source"]["features"]["distance_to_mule"], 2);
  EXPECT_TRUE(json["target"]["features"].is_null());
  EXPECT_EQ(json["risk"]["recommendation"], "REVIEW");
}

TEST(RiskAssessmentTest, ConcentrationAloneIsMonitored) {
  AccountView source = view("S");
  source.features.top_counterparty_share = 0.9;
  source.features.total_transactions = 10;
  source.features.diversity_ratio = 0.2;

  RiskAssessment risk = QueryService::assessRisk(source, view("T"), QueryService::Config{});
  EXPECT_TRUE(risk.concentration_risk);
  EXPECT_FALSE(risk.isHighRisk());
  EXPECT_EQ(risk.recommendation, "MONITOR");
}

TEST(RiskAssessmentTest, LowDiversityNeedsEnoughTransactions) {
  AccountView source = view("S");
  source.features.diversity_ratio = 0.05;
  source.features.total_transactions = 40;

  QueryService::Config config;
  EXPECT_FALSE(QueryService::assessRisk(source, view("T"), config).low_diversity_risk);

  source.features.total_transactions = 60;
  RiskAssessment risk = QueryService::assessRisk(source, view("T"), config);
  EXPECT_TRUE(risk.low_diversity_risk);
  EXPECT_EQ(risk.recommendation, "REVIEW");
}

TEST(RiskAssessmentTest, DensityOnBothSidesIsBlocked) {
  AccountView source = view("S");
  AccountView target = view("T");
  source.features.mule_density = 0.3;
  EXPECT_EQ(QueryService::assessRisk(source, target, QueryService::Config{}).recommendation,
            "REVIEW");

  target.features.distance_to_mule = 1;
  RiskAssessment risk = QueryService::assessRisk(source, target, QueryService::Config{});
  EXPECT_TRUE(risk.density_risk);
  EXPECT_TRUE(risk.proximity_risk);
  EXPECT_EQ(risk.recommendation, "BLOCK");
  EXPECT_EQ(risk.risk_factors.size(), 2u);
}

TEST(RiskAssessmentTest, ThresholdsAreStrict) {
  AccountView source = view("S");
  source.features.mule_density = 0.2;
  source.features.top_counterparty_share = 0.5;
  source.features.distance_to_mule = 3;

  RiskAssessment risk = QueryService::assessRisk(source, view("T"), QueryService::Config{});
  EXPECT_FALSE(risk.density_risk);
  EXPECT_FALSE(risk.concentration_risk);
  EXPECT_FALSE(risk.proximity_risk);
  EXPECT_EQ(risk.recommendation, "ALLOW");
}
