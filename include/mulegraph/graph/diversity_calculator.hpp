#ifndef MULEGRAPH_GRAPH_DIVERSITY_CALCULATOR_HPP_
#define MULEGRAPH_GRAPH_DIVERSITY_CALCULATOR_HPP_

#include "mulegraph/model.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace mulegraph {
namespace concurrent {
class CancellationToken;
class ParallelExecutor;
}  // namespace concurrent

namespace graph {

struct DiversityMetrics {
  std::size_t unique_counterparties = 0;
  std::size_t total_transactions = 0;
  double diversity_ratio = 0.0;
  double top_counterparty_share = 0.0;
  std::size_t outgoing_transactions = 0;
  std::size_t incoming_transactions = 0;
  // Most frequent counterparty, lowest id on ties
  std::optional<AccountId> top_counterparty;
};

/**
 * Counterparty concentration of an account's transactions.
 *
 * Only transactions between two distinct accounts count. Real-time and batch
 * modes share the same computation; batch mode runs it for every account in
 * parallel over a prebuilt counterparty index.
 */
class DiversityCalculator {
 public:
  explicit DiversityCalculator(const concurrent::ParallelExecutor* executor = nullptr);

  /**
   * Real-time mode: scans the edge list for one account.
   */
  DiversityMetrics computeForAccount(const std::vector<TransactionEdge>& edges,
                                     AccountId account) const;

  /**
   * Batch mode: metrics for every account in `accounts`.
   */
  std::map<AccountId, DiversityMetrics> computeAll(
      const std::vector<Account>& accounts, const std::vector<TransactionEdge>& edges,
      const concurrent::CancellationToken* cancel = nullptr) const;

  /**
   * Metrics from the multiset of counterparty occurrences of one account.
   */
  static DiversityMetrics fromCounterparties(std::vector<AccountId> counterparties,
                                             std::size_t outgoing, std::size_t incoming);

 private:
  const concurrent::ParallelExecutor* executor_;
};

}  // namespace graph
}  // namespace mulegraph

#endif  // MULEGRAPH_GRAPH_DIVERSITY_CALCULATOR_HPP_
