#include "mulegraph/concurrent/cancellation.hpp"
#include "mulegraph/concurrent/parallel_executor.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/graph/proximity_engine.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <deque>
#include <limits>
#include <set>

using namespace mulegraph;
using namespace mulegraph::graph;
using fixtures::account;
using fixtures::transfer;

namespace {

// Unbounded BFS from one node; returns hop counts to every node
std::vector<std::size_t> hopsFrom(const ProjectedGraph& graph, std::size_t start) {
  std::vector<std::size_t> hops(graph.nodeCount(), std::numeric_limits<std::size_t>::max());
  std::deque<std::size_t> queue = {start};
  hops[start] = 0;
  while (!queue.empty()) {
    std::size_t u = queue.front();
    queue.pop_front();
    for (const auto& neighbor : graph.neighbors(u)) {
      if (hops[neighbor.node] == std::numeric_limits<std::size_t>::max()) {
        hops[neighbor.node] = hops[u] + 1;
        queue.push_back(neighbor.node);
      }
    }
  }
  return hops;
}

void expectValidPath(const ProjectedGraph& graph, const ProximityRecord& record,
                     const std::string& from) {
  ASSERT_TRUE(record.reached());
  ASSERT_EQ(record.path.size(), *record.distance + 1);
  EXPECT_EQ(record.path.front(), from);
  EXPECT_EQ(record.path.back(), *record.nearest_mule);
  for (std::size_t k = 0; k + 1 < record.path.size(); ++k) {
    AccountId a = graph.account(*graph.indexOfNumber(record.path[k])).id;
    AccountId b = graph.account(*graph.indexOfNumber(record.path[k + 1])).id;
    EXPECT_GT(graph.weight(a, b), 0.0) << record.path[k] << " -> " << record.path[k + 1];
  }
}

}  // namespace

class ProximityEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto g = fixtures::muleChain();
    graph_ = ProjectionBuilder().build(g.accounts, g.edges);
    mules_ = ProximityEngine::confirmedMules(graph_);
  }

  ProjectedGraph graph_;
  std::vector<AccountId> mules_;
};

TEST_F(ProximityEngineTest, ChainDistances) {
  auto records = ProximityEngine().computeAll(graph_, mules_);

  ASSERT_EQ(records.size(), 4u);
  EXPECT_EQ(records.at(4).distance, 0u);
  EXPECT_EQ(records.at(2).distance, 1u);
  EXPECT_EQ(records.at(1).distance, 2u);
  EXPECT_FALSE(records.at(3).distance.has_value());
  EXPECT_FALSE(records.at(3).nearest_mule.has_value());
  EXPECT_TRUE(records.at(3).path.empty());

  EXPECT_EQ(records.at(1).nearest_mule, std::string("M"));
  EXPECT_EQ(records.at(1).nearest_mule_id, 4u);
  EXPECT_EQ(records.at(1).path, (std::vector<std::string>{"A", "B", "M"}));
  EXPECT_EQ(records.at(1).tied_mules, (std::vector<std::string>{"M"}));
}

TEST_F(ProximityEngineTest, MuleIsItsOwnNearestMule) {
  auto records = ProximityEngine().computeAll(graph_, mules_);
  const ProximityRecord& mule = records.at(4);

  EXPECT_EQ(mule.distance, 0u);
  EXPECT_EQ(mule.nearest_mule, std::string("M"));
  EXPECT_EQ(mule.path, (std::vector<std::string>{"M"}));

  ProximityRecord on_demand = ProximityEngine().computeForAccount(graph_, mules_, 4);
  EXPECT_EQ(on_demand.distance, 0u);
  EXPECT_EQ(on_demand.path, (std::vector<std::string>{"M"}));
}

TEST_F(ProximityEngineTest, OnDemandMatchesChainScenario) {
  ProximityEngine engine;
  ProximityRecord a = engine.computeForAccount(graph_, mules_, 1);
  EXPECT_EQ(a.distance, 2u);
  EXPECT_EQ(a.path, (std::vector<std::string>{"A", "B", "M"}));

  ProximityRecord c = engine.computeForAccount(graph_, mules_, 3);
  EXPECT_FALSE(c.reached());

  EXPECT_THROW(engine.computeForAccount(graph_, mules_, 99), UnknownAccountError);
}

TEST(ProximityEngineTiesTest, ReportsAllTiedMules) {
  std::vector<Account> accounts = {account(1, "X"), account(10, "M2", true),
                                   account(11, "M1", true), account(12, "Y")};
  std::vector<TransactionEdge> edges = {transfer(1, 10), transfer(11, 1), transfer(12, 1)};
  ProjectedGraph graph = ProjectionBuilder().build(accounts, edges);
  auto mules = ProximityEngine::confirmedMules(graph);

  auto records = ProximityEngine().computeAll(graph, mules);

  const ProximityRecord& x = records.at(1);
  EXPECT_EQ(x.distance, 1u);
  EXPECT_EQ(x.tied_mules, (std::vector<std::string>{"M1", "M2"}));
  EXPECT_EQ(x.nearest_mule, std::string("M1"));
  EXPECT_EQ(x.nearest_mule_id, 11u);
  EXPECT_EQ(x.path, (std::vector<std::string>{"X", "M1"}));

  const ProximityRecord& y = records.at(12);
  EXPECT_EQ(y.distance, 2u);
  EXPECT_EQ(y.tied_mules, (std::vector<std::string>{"M1", "M2"}));
  EXPECT_EQ(y.path, (std::vector<std::string>{"Y", "X", "M1"}));

  ProximityRecord on_demand = ProximityEngine().computeForAccount(graph, mules, 12);
  EXPECT_EQ(on_demand.tied_mules, y.tied_mules);
  EXPECT_EQ(on_demand.nearest_mule, y.nearest_mule);
}

TEST(ProximityEngineDepthTest, StopsAtMaxDepth) {
  std::vector<Account> accounts = {account(1, "M", true), account(2, "P1"), account(3, "P2"),
                                   account(4, "P3"), account(5, "P4")};
  std::vector<TransactionEdge> edges = {transfer(1, 2), transfer(2, 3), transfer(3, 4),
                                        transfer(4, 5)};
  ProjectedGraph graph = ProjectionBuilder().build(accounts, edges);

  ProximityEngine::Config config;
  config.max_depth = 2;
  ProximityEngine engine(config);
  auto records = engine.computeAll(graph, {1});

  EXPECT_EQ(records.at(3).distance, 2u);
  EXPECT_FALSE(records.at(4).reached());
  EXPECT_FALSE(records.at(5).reached());
  EXPECT_FALSE(engine.computeForAccount(graph, {1}, 4).reached());
  EXPECT_EQ(engine.computeForAccount(graph, {1}, 4, 3).distance, 3u);
}

TEST(ProximityEngineDepthTest, NoMulesLeavesEverythingUnset) {
  std::vector<Account> accounts = {account(1, "A"), account(2, "B")};
  ProjectedGraph graph = ProjectionBuilder().build(accounts, {transfer(1, 2)});

  auto records = ProximityEngine().computeAll(graph, {});
  EXPECT_FALSE(records.at(1).reached());
  EXPECT_FALSE(records.at(2).reached());
}

TEST(ProximityEngineDepthTest, RejectsUnknownMule) {
  std::vector<Account> accounts = {account(1, "A")};
  ProjectedGraph graph = ProjectionBuilder().build(accounts, {});
  EXPECT_THROW(ProximityEngine().computeAll(graph, {5}), GraphLoadError);
}

// Compares the parallel level-synchronous search with brute force and with
// the on-demand search over a random graph.
TEST(ProximityEngineRandomTest, MatchesBruteForceAndOnDemand) {
  auto g = fixtures::randomGraph(40, 55, 2024);
  ProjectedGraph graph = ProjectionBuilder().build(g.accounts, g.edges);
  auto mules = ProximityEngine::confirmedMules(graph);
  ASSERT_EQ(mules.size(), 4u);

  concurrent::ParallelExecutor executor(4, 1);
  ProximityEngine::Config config;
  config.max_depth = 3;
  ProximityEngine engine(config, &executor);

  auto records = engine.computeAll(graph, mules);
  ASSERT_EQ(records.size(), graph.nodeCount());

  for (std::size_t v = 0; v < graph.nodeCount(); ++v) {
    const Account& acc = graph.account(v);
    std::vector<std::size_t> hops = hopsFrom(graph, v);

    std::size_t best = std::numeric_limits<std::size_t>::max();
    for (AccountId mule : mules) best = std::min(best, hops[*graph.indexOf(mule)]);

    std::vector<std::string> tied;
    for (AccountId mule : mules) {
      std::size_t node = *graph.indexOf(mule);
      if (hops[node] == best) tied.push_back(graph.account(node).account_number);
    }
    std::sort(tied.begin(), tied.end());

    const ProximityRecord& record = records.at(acc.id);
    if (best > config.max_depth) {
      EXPECT_FALSE(record.reached()) << acc.account_number;
    } else {
      ASSERT_TRUE(record.reached()) << acc.account_number;
      EXPECT_EQ(*record.distance, best) << acc.account_number;
      EXPECT_EQ(record.tied_mules, tied) << acc.account_number;
      EXPECT_EQ(*record.nearest_mule, tied.front()) << acc.account_number;
      expectValidPath(graph, record, acc.account_number);
    }

    ProximityRecord on_demand = engine.computeForAccount(graph, mules, acc.id);
    EXPECT_EQ(on_demand.distance, record.distance) << acc.account_number;
    EXPECT_EQ(on_demand.nearest_mule, record.nearest_mule) << acc.account_number;
    EXPECT_EQ(on_demand.tied_mules, record.tied_mules) << acc.account_number;
    EXPECT_EQ(on_demand.path, record.path) << acc.account_number;
  }
}

TEST_F(ProximityEngineTest, OnDemandPathMatchesBatchWithParallelShortestPaths) {
  // Two shortest routes S-X1-Y2-M and S-X2-Y1-M to the only mule
  std::vector<Account> accounts = {account(1, "S"), account(2, "X1"), account(3, "X2"),
                                   account(4, "Y1"), account(5, "Y2"), account(6, "M", true)};
  std::vector<TransactionEdge> edges = {transfer(1, 2), transfer(2, 5), transfer(5, 6),
                                        transfer(1, 3), transfer(3, 4), transfer(4, 6)};
  ProjectedGraph graph = ProjectionBuilder().build(accounts, edges);
  ProximityEngine engine;
  std::vector<AccountId> mules = {6};

  auto records = engine.computeAll(graph, mules);
  std::vector<std::string> expected = {"S", "X1", "Y2", "M"};
  EXPECT_EQ(records.at(1).path, expected);

  ProximityRecord on_demand = engine.computeForAccount(graph, mules, 1);
  EXPECT_EQ(on_demand.path, expected);
  EXPECT_EQ(on_demand.distance, records.at(1).distance);
}

TEST(ProximityEngineRandomTest, HonorsCancellation) {
  auto g = fixtures::randomGraph(20, 30, 5);
  ProjectedGraph graph = ProjectionBuilder().build(g.accounts, g.edges);
  concurrent::CancellationToken token;
  token.cancel();

  EXPECT_THROW(ProximityEngine().computeAll(graph, ProximityEngine::confirmedMules(graph), &token),
               BatchCancelledError);
}
