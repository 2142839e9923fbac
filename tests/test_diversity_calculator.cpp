#include "mulegraph/concurrent/cancellation.hpp"
#include "mulegraph/concurrent/parallel_executor.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/graph/diversity_calculator.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

using namespace mulegraph;
using namespace mulegraph::graph;
using fixtures::account;
using fixtures::transfer;

class DiversityCalculatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    accounts_ = {account(1, "X"), account(2, "Y"), account(3, "Z"), account(4, "Idle")};
    for (int i = 0; i < 8; ++i) edges_.push_back(transfer(1, 2, 100.0));
    for (int i = 0; i < 2; ++i) edges_.push_back(transfer(1, 3, 50.0));
  }

  std::vector<Account> accounts_;
  std::vector<TransactionEdge> edges_;
};

TEST_F(DiversityCalculatorTest, ConcentratedSender) {
  DiversityMetrics x = DiversityCalculator().computeForAccount(edges_, 1);

  EXPECT_EQ(x.unique_counterparties, 2u);
  EXPECT_EQ(x.total_transactions, 10u);
  EXPECT_DOUBLE_EQ(x.diversity_ratio, 0.2);
  EXPECT_DOUBLE_EQ(x.top_counterparty_share, 0.8);
  EXPECT_EQ(x.outgoing_transactions, 10u);
  EXPECT_EQ(x.incoming_transactions, 0u);
  EXPECT_EQ(x.top_counterparty, 2u);
}

TEST_F(DiversityCalculatorTest, IncomingTransactionsCount) {
  DiversityMetrics y = DiversityCalculator().computeForAccount(edges_, 2);

  EXPECT_EQ(y.unique_counterparties, 1u);
  EXPECT_EQ(y.total_transactions, 8u);
  EXPECT_DOUBLE_EQ(y.diversity_ratio, 0.125);
  EXPECT_DOUBLE_EQ(y.top_counterparty_share, 1.0);
  EXPECT_EQ(y.incoming_transactions, 8u);
}

TEST_F(DiversityCalculatorTest, NoTransactionsGivesZeroRatios) {
  DiversityMetrics idle = DiversityCalculator().computeForAccount(edges_, 4);

  EXPECT_EQ(idle.total_transactions, 0u);
  EXPECT_EQ(idle.unique_counterparties, 0u);
  EXPECT_DOUBLE_EQ(idle.diversity_ratio, 0.0);
  EXPECT_DOUBLE_EQ(idle.top_counterparty_share, 0.0);
  EXPECT_FALSE(idle.top_counterparty.has_value());
}

TEST_F(DiversityCalculatorTest, IgnoresSelfAndNonAccountTransactions) {
  edges_.push_back(transfer(4, 4, 10.0));
  edges_.push_back(TransactionEdge(4, 900, 10.0, 0, EntityKind::ACCOUNT, EntityKind::OTHER));
  edges_.push_back(TransactionEdge(901, 4, 10.0, 0, EntityKind::OTHER, EntityKind::ACCOUNT));

  DiversityMetrics idle = DiversityCalculator().computeForAccount(edges_, 4);
  EXPECT_EQ(idle.total_transactions, 0u);
}

TEST_F(DiversityCalculatorTest, CounterpartyInBothDirectionsCountsOnce) {
  edges_.push_back(transfer(3, 1, 5.0));
  DiversityMetrics x = DiversityCalculator().computeForAccount(edges_, 1);

  EXPECT_EQ(x.unique_counterparties, 2u);
  EXPECT_EQ(x.total_transactions, 11u);
  EXPECT_DOUBLE_EQ(x.diversity_ratio, 0.1818);
  EXPECT_DOUBLE_EQ(x.top_counterparty_share, 0.7273);
}

TEST_F(DiversityCalculatorTest, TopCounterpartyTieGoesToLowestId) {
  std::vector<TransactionEdge> edges = {transfer(1, 3), transfer(1, 2), transfer(3, 1),
                                        transfer(2, 1)};
  DiversityMetrics x = DiversityCalculator().computeForAccount(edges, 1);
  EXPECT_EQ(x.top_counterparty, 2u);
  EXPECT_DOUBLE_EQ(x.top_counterparty_share, 0.5);
}

TEST(DiversityCalculatorBatchTest, BatchMatchesRealTime) {
  auto g = fixtures::randomGraph(80, 400, 99);
  concurrent::ParallelExecutor executor(4, 1);
  DiversityCalculator calculator(&executor);

  auto all = calculator.computeAll(g.accounts, g.edges);
  ASSERT_EQ(all.size(), g.accounts.size());

  for (const auto& acc : g.accounts) {
    DiversityMetrics single = calculator.computeForAccount(g.edges, acc.id);
    const DiversityMetrics& batch = all.at(acc.id);
    EXPECT_EQ(batch.unique_counterparties, single.unique_counterparties);
    EXPECT_EQ(batch.total_transactions, single.total_transactions);
    EXPECT_EQ(batch.diversity_ratio, single.diversity_ratio);
    EXPECT_EQ(batch.top_counterparty_share, single.top_counterparty_share);
    EXPECT_LE(batch.diversity_ratio, 1.0);
    EXPECT_LE(batch.top_counterparty_share, 1.0);
  }
}

TEST(DiversityCalculatorBatchTest, HonorsCancellation) {
  auto g = fixtures::randomGraph(10, 20, 1);
  concurrent::CancellationToken token;
  token.cancel();
  EXPECT_THROW(DiversityCalculator().computeAll(g.accounts, g.edges, &token),
               BatchCancelledError);
}
