#include "mulegraph/graph/projection_builder.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/observability/logger.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace mulegraph {
namespace graph {

std::optional<std::size_t> ProjectedGraph::indexOf(AccountId id) const {
  auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::size_t> ProjectedGraph::indexOfNumber(const std::string& account_number) const {
  auto it = index_by_number_.find(account_number);
  if (it == index_by_number_.end()) return std::nullopt;
  return it->second;
}

double ProjectedGraph::weight(AccountId a, AccountId b) const {
  auto from = indexOf(a);
  auto to = indexOf(b);
  if (!from || !to) return 0.0;

  const auto& list = adjacency_[*from];
  auto it = std::lower_bound(list.begin(), list.end(), *to,
                             [](const Neighbor& n, std::size_t node) { return n.node < node; });
  if (it != list.end() && it->node == *to) return it->weight;
  return 0.0;
}

ProjectedGraph ProjectionBuilder::build(const std::vector<Account>& accounts,
                                        const std::vector<TransactionEdge>& edges) const {
  ProjectedGraph graph;
  graph.accounts_ = accounts;
  std::sort(graph.accounts_.begin(), graph.accounts_.end(),
            [](const Account& a, const Account& b) { return a.id < b.id; });

  for (std::size_t i = 0; i < graph.accounts_.size(); ++i) {
    const Account& account = graph.accounts_[i];
    if (!graph.index_by_id_.emplace(account.id, i).second) {
      throw GraphLoadError("Duplicate account id " + std::to_string(account.id));
    }
    if (!graph.index_by_number_.emplace(account.account_number, i).second) {
      throw GraphLoadError("Duplicate account number " + account.account_number);
    }
  }

  // Amounts are grouped per canonical pair and summed in sorted order so the
  // weight does not depend on the order edges arrive in.
  std::map<std::pair<AccountId, AccountId>, std::vector<double>> pair_amounts;
  std::size_t skipped_foreign = 0;
  std::size_t skipped_self = 0;

  for (const auto& edge : edges) {
    if (!std::isfinite(edge.amount) || edge.amount < 0.0) {
      throw GraphLoadError("Malformed amount on transaction " +
                           std::to_string(edge.performer) + " -> " +
                           std::to_string(edge.beneficiary));
    }
    if (edge.performer_kind == EntityKind::ACCOUNT && !graph.index_by_id_.count(edge.performer)) {
      throw GraphLoadError("Transaction references unknown performer account " +
                           std::to_string(edge.performer));
    }
    if (edge.beneficiary_kind == EntityKind::ACCOUNT &&
        !graph.index_by_id_.count(edge.beneficiary)) {
      throw GraphLoadError("Transaction references unknown beneficiary account " +
                           std::to_string(edge.beneficiary));
    }
    if (!edge.betweenAccounts()) {
      ++skipped_foreign;
      continue;
    }
    if (edge.performer == edge.beneficiary) {
      ++skipped_self;
      continue;
    }

    auto key = std::minmax(edge.performer, edge.beneficiary);
    pair_amounts[{key.first, key.second}].push_back(edge.amount);
  }

  std::size_t n = graph.accounts_.size();
  graph.adjacency_.assign(n, {});
  graph.degree_.assign(n, 0.0);

  for (auto& [pair, amounts] : pair_amounts) {
    std::sort(amounts.begin(), amounts.end());
    double weight = 0.0;
    for (double amount : amounts) weight += amount;
    if (weight <= 0.0) continue;

    std::size_t low = graph.index_by_id_.at(pair.first);
    std::size_t high = graph.index_by_id_.at(pair.second);
    graph.edges_.push_back({pair.first, pair.second, weight});
    graph.adjacency_[low].push_back({high, weight});
    graph.adjacency_[high].push_back({low, weight});
    graph.degree_[low] += weight;
    graph.degree_[high] += weight;
    graph.total_weight_ += weight;
  }

  for (auto& list : graph.adjacency_) {
    std::sort(list.begin(), list.end(),
              [](const Neighbor& a, const Neighbor& b) { return a.node < b.node; });
  }

  LOG_BUILDER(observability::LogLevel::DEBUG, "Projected account graph")
      .field("accounts", static_cast<std::uint64_t>(n))
      .field("transactions", static_cast<std::uint64_t>(edges.size()))
      .field("projected_edges", static_cast<std::uint64_t>(graph.edges_.size()))
      .field("skipped_non_account", static_cast<std::uint64_t>(skipped_foreign))
      .field("skipped_self", static_cast<std::uint64_t>(skipped_self));

  return graph;
}

}  // namespace graph
}  // namespace mulegraph
