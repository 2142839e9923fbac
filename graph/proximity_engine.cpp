#include "mulegraph/graph/proximity_engine.hpp"
#include "mulegraph/concurrent/cancellation.hpp"
#include "mulegraph/concurrent/parallel_executor.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/observability/logger.hpp"

#include <algorithm>
#include <iterator>
#include <limits>

namespace mulegraph {
namespace graph {

namespace {

constexpr std::size_t kUnreached = std::numeric_limits<std::size_t>::max();

// Node with the smallest account number among the candidates
std::size_t lowestAccountNumber(const ProjectedGraph& graph,
                                const std::vector<std::size_t>& nodes) {
  return *std::min_element(nodes.begin(), nodes.end(), [&graph](std::size_t a, std::size_t b) {
    return graph.account(a).account_number < graph.account(b).account_number;
  });
}

// Hop counts from origin, leaving nodes beyond limit unreached
std::vector<std::size_t> boundedDistances(const ProjectedGraph& graph, std::size_t origin,
                                          std::size_t limit) {
  std::vector<std::size_t> distance(graph.nodeCount(), kUnreached);
  distance[origin] = 0;
  std::vector<std::size_t> frontier = {origin};
  for (std::size_t level = 0; level < limit && !frontier.empty(); ++level) {
    std::vector<std::size_t> next;
    for (std::size_t u : frontier) {
      for (const auto& neighbor : graph.neighbors(u)) {
        if (distance[neighbor.node] != kUnreached) continue;
        distance[neighbor.node] = level + 1;
        next.push_back(neighbor.node);
      }
    }
    frontier.swap(next);
  }
  return distance;
}

std::vector<std::string> accountNumbersSorted(const ProjectedGraph& graph,
                                              const std::vector<std::size_t>& nodes) {
  std::vector<std::string> numbers;
  numbers.reserve(nodes.size());
  for (std::size_t node : nodes) numbers.push_back(graph.account(node).account_number);
  std::sort(numbers.begin(), numbers.end());
  return numbers;
}

}  // namespace

ProximityEngine::ProximityEngine() : ProximityEngine(Config{}) {}

ProximityEngine::ProximityEngine(const Config& config,
                                 const concurrent::ParallelExecutor* executor)
    : config_(config), executor_(executor) {
}

std::vector<AccountId> ProximityEngine::confirmedMules(const ProjectedGraph& graph) {
  std::vector<AccountId> mules;
  for (const auto& account : graph.accounts()) {
    if (account.isConfirmedMule()) mules.push_back(account.id);
  }
  return mules;
}

std::vector<std::size_t> ProximityEngine::resolveMules(const ProjectedGraph& graph,
                                                       const std::vector<AccountId>& mule_ids) const {
  std::vector<std::size_t> nodes;
  nodes.reserve(mule_ids.size());
  for (AccountId id : mule_ids) {
    auto node = graph.indexOf(id);
    if (!node) {
      throw GraphLoadError("Mule account " + std::to_string(id) + " is not in the graph");
    }
    nodes.push_back(*node);
  }
  std::sort(nodes.begin(), nodes.end());
  nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());
  return nodes;
}

std::map<AccountId, ProximityRecord> ProximityEngine::computeAll(
    const ProjectedGraph& graph, const std::vector<AccountId>& mule_ids,
    const concurrent::CancellationToken* cancel) const {
  const std::size_t n = graph.nodeCount();
  std::vector<std::size_t> distance(n, kUnreached);
  // Mule sources at minimal distance, as node indices sorted ascending
  std::vector<std::vector<std::size_t>> sources(n);

  std::vector<std::size_t> frontier = resolveMules(graph, mule_ids);
  for (std::size_t mule : frontier) {
    distance[mule] = 0;
    sources[mule] = {mule};
  }

  std::vector<bool> queued(n, false);
  std::size_t reached = frontier.size();

  for (std::size_t level = 0; level < config_.max_depth && !frontier.empty(); ++level) {
    concurrent::checkCancelled(cancel, "proximity level " + std::to_string(level));

    std::vector<std::size_t> candidates;
    for (std::size_t u : frontier) {
      for (const auto& neighbor : graph.neighbors(u)) {
        if (distance[neighbor.node] == kUnreached && !queued[neighbor.node]) {
          queued[neighbor.node] = true;
          candidates.push_back(neighbor.node);
        }
      }
    }
    std::sort(candidates.begin(), candidates.end());

    // Each candidate pulls the union of sources from its neighbors on the
    // current level. Only distances of earlier levels are read here.
    std::vector<std::vector<std::size_t>> pulled(candidates.size());
    auto relax = [&](std::size_t begin, std::size_t end) {
      for (std::size_t idx = begin; idx < end; ++idx) {
        std::vector<std::size_t> merged;
        for (const auto& neighbor : graph.neighbors(candidates[idx])) {
          if (distance[neighbor.node] != level) continue;
          const auto& from = sources[neighbor.node];
          std::vector<std::size_t> combined;
          combined.reserve(merged.size() + from.size());
          std::set_union(merged.begin(), merged.end(), from.begin(), from.end(),
                         std::back_inserter(combined));
          merged.swap(combined);
        }
        pulled[idx] = std::move(merged);
      }
    };

    if (executor_) {
      executor_->forEachRange(candidates.size(), relax);
    } else {
      relax(0, candidates.size());
    }

    for (std::size_t idx = 0; idx < candidates.size(); ++idx) {
      std::size_t node = candidates[idx];
      distance[node] = level + 1;
      sources[node] = std::move(pulled[idx]);
      queued[node] = false;
    }
    reached += candidates.size();
    frontier.swap(candidates);
  }

  std::vector<ProximityRecord> records(n);
  auto finish = [&](std::size_t begin, std::size_t end) {
    for (std::size_t v = begin; v < end; ++v) {
      if (distance[v] == kUnreached) continue;
      ProximityRecord& record = records[v];
      std::size_t nearest = lowestAccountNumber(graph, sources[v]);
      record.distance = distance[v];
      record.nearest_mule_id = graph.account(nearest).id;
      record.nearest_mule = graph.account(nearest).account_number;
      record.tied_mules = accountNumbersSorted(graph, sources[v]);

      if (!config_.build_paths) continue;
      std::size_t current = v;
      record.path.push_back(graph.account(current).account_number);
      while (distance[current] > 0) {
        std::vector<std::size_t> steps;
        for (const auto& neighbor : graph.neighbors(current)) {
          const auto& reach = sources[neighbor.node];
          if (distance[neighbor.node] + 1 == distance[current] &&
              std::binary_search(reach.begin(), reach.end(), nearest)) {
            steps.push_back(neighbor.node);
          }
        }
        current = lowestAccountNumber(graph, steps);
        record.path.push_back(graph.account(current).account_number);
      }
    }
  };

  if (executor_) {
    executor_->forEachRange(n, finish);
  } else {
    finish(0, n);
  }

  std::map<AccountId, ProximityRecord> result;
  for (std::size_t v = 0; v < n; ++v) {
    result.emplace(graph.account(v).id, std::move(records[v]));
  }

  LOG_BUILDER(observability::LogLevel::DEBUG, "Proximity search finished")
      .field("mules", static_cast<std::uint64_t>(mule_ids.size()))
      .field("reached", static_cast<std::uint64_t>(reached))
      .field("accounts", static_cast<std::uint64_t>(n))
      .field("max_depth", static_cast<std::uint64_t>(config_.max_depth));

  return result;
}

ProximityRecord ProximityEngine::computeForAccount(const ProjectedGraph& graph,
                                                   const std::vector<AccountId>& mule_ids,
                                                   AccountId account) const {
  return computeForAccount(graph, mule_ids, account, config_.max_depth);
}

ProximityRecord ProximityEngine::computeForAccount(const ProjectedGraph& graph,
                                                   const std::vector<AccountId>& mule_ids,
                                                   AccountId account,
                                                   std::size_t max_depth) const {
  auto start = graph.indexOf(account);
  if (!start) {
    throw UnknownAccountError(std::to_string(account));
  }

  std::vector<std::size_t> mule_nodes = resolveMules(graph, mule_ids);
  std::vector<bool> is_mule(graph.nodeCount(), false);
  for (std::size_t node : mule_nodes) is_mule[node] = true;

  ProximityRecord record;
  if (is_mule[*start]) {
    const Account& self = graph.account(*start);
    record.distance = 0;
    record.nearest_mule_id = self.id;
    record.nearest_mule = self.account_number;
    record.tied_mules = {self.account_number};
    record.path = {self.account_number};
    return record;
  }

  std::vector<std::size_t> distance(graph.nodeCount(), kUnreached);
  distance[*start] = 0;
  std::vector<std::size_t> frontier = {*start};
  std::vector<std::size_t> found;

  for (std::size_t level = 0; level < max_depth && !frontier.empty() && found.empty();
       ++level) {
    std::vector<std::size_t> next;
    for (std::size_t u : frontier) {
      for (const auto& neighbor : graph.neighbors(u)) {
        if (distance[neighbor.node] != kUnreached) continue;
        distance[neighbor.node] = level + 1;
        next.push_back(neighbor.node);
        if (is_mule[neighbor.node]) found.push_back(neighbor.node);
      }
    }
    frontier.swap(next);
  }

  if (found.empty()) return record;

  std::size_t nearest = lowestAccountNumber(graph, found);
  record.distance = distance[nearest];
  record.nearest_mule_id = graph.account(nearest).id;
  record.nearest_mule = graph.account(nearest).account_number;
  record.tied_mules = accountNumbersSorted(graph, found);

  if (config_.build_paths) {
    // Forward walk from the account, each step taking the lowest numbered
    // neighbor one hop closer to the nearest mule, as the batch search does.
    std::vector<std::size_t> to_mule = boundedDistances(graph, nearest, *record.distance);
    std::size_t current = *start;
    record.path.push_back(graph.account(current).account_number);
    while (current != nearest) {
      std::vector<std::size_t> steps;
      for (const auto& neighbor : graph.neighbors(current)) {
        if (to_mule[neighbor.node] != kUnreached &&
            to_mule[neighbor.node] + 1 == to_mule[current]) {
          steps.push_back(neighbor.node);
        }
      }
      current = lowestAccountNumber(graph, steps);
      record.path.push_back(graph.account(current).account_number);
    }
  }
  return record;
}

}  // namespace graph
}  // namespace mulegraph
