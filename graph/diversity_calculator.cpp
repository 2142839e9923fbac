#include "mulegraph/graph/diversity_calculator.hpp"
#include "mulegraph/concurrent/cancellation.hpp"
#include "mulegraph/concurrent/parallel_executor.hpp"
#include "mulegraph/graph/feature_math.hpp"

#include <algorithm>
#include <unordered_map>

namespace mulegraph {
namespace graph {

namespace {

bool qualifies(const TransactionEdge& edge) {
  return edge.betweenAccounts() && edge.performer != edge.beneficiary;
}

struct Occurrences {
  std::vector<AccountId> counterparties;
  std::size_t outgoing = 0;
  std::size_t incoming = 0;
};

}  // namespace

DiversityCalculator::DiversityCalculator(const concurrent::ParallelExecutor* executor)
    : executor_(executor) {
}

DiversityMetrics DiversityCalculator::fromCounterparties(std::vector<AccountId> counterparties,
                                                         std::size_t outgoing,
                                                         std::size_t incoming) {
  DiversityMetrics metrics;
  metrics.outgoing_transactions = outgoing;
  metrics.incoming_transactions = incoming;
  metrics.total_transactions = counterparties.size();
  if (counterparties.empty()) return metrics;

  std::sort(counterparties.begin(), counterparties.end());

  std::size_t best_run = 0;
  for (std::size_t i = 0; i < counterparties.size();) {
    std::size_t j = i;
    while (j < counterparties.size() && counterparties[j] == counterparties[i]) ++j;
    metrics.unique_counterparties += 1;
    if (j - i > best_run) {
      best_run = j - i;
      metrics.top_counterparty = counterparties[i];
    }
    i = j;
  }

  metrics.diversity_ratio = safeRatio(metrics.unique_counterparties, metrics.total_transactions);
  metrics.top_counterparty_share = safeRatio(best_run, metrics.total_transactions);
  return metrics;
}

DiversityMetrics DiversityCalculator::computeForAccount(const std::vector<TransactionEdge>& edges,
                                                        AccountId account) const {
  Occurrences occurrences;
  for (const auto& edge : edges) {
    if (!qualifies(edge)) continue;
    if (edge.performer == account) {
      occurrences.counterparties.push_back(edge.beneficiary);
      occurrences.outgoing += 1;
    } else if (edge.beneficiary == account) {
      occurrences.counterparties.push_back(edge.performer);
      occurrences.incoming += 1;
    }
  }
  return fromCounterparties(std::move(occurrences.counterparties), occurrences.outgoing,
                            occurrences.incoming);
}

std::map<AccountId, DiversityMetrics> DiversityCalculator::computeAll(
    const std::vector<Account>& accounts, const std::vector<TransactionEdge>& edges,
    const concurrent::CancellationToken* cancel) const {
  std::unordered_map<AccountId, std::size_t> slot;
  for (std::size_t i = 0; i < accounts.size(); ++i) {
    slot.emplace(accounts[i].id, i);
  }

  std::vector<Occurrences> index(accounts.size());
  for (const auto& edge : edges) {
    if (!qualifies(edge)) continue;
    auto from = slot.find(edge.performer);
    if (from != slot.end()) {
      index[from->second].counterparties.push_back(edge.beneficiary);
      index[from->second].outgoing += 1;
    }
    auto to = slot.find(edge.beneficiary);
    if (to != slot.end()) {
      index[to->second].counterparties.push_back(edge.performer);
      index[to->second].incoming += 1;
    }
  }

  concurrent::checkCancelled(cancel, "diversity index");

  std::vector<DiversityMetrics> metrics(accounts.size());
  auto compute = [&](std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
      metrics[i] = fromCounterparties(std::move(index[i].counterparties), index[i].outgoing,
                                      index[i].incoming);
    }
  };

  if (executor_) {
    executor_->forEachRange(accounts.size(), compute);
  } else {
    compute(0, accounts.size());
  }

  concurrent::checkCancelled(cancel, "diversity computation");

  std::map<AccountId, DiversityMetrics> result;
  for (std::size_t i = 0; i < accounts.size(); ++i) {
    result.emplace(accounts[i].id, metrics[i]);
  }
  return result;
}

}  // namespace graph
}  // namespace mulegraph
