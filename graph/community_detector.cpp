#include "mulegraph/graph/community_detector.hpp"
#include "mulegraph/concurrent/cancellation.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/observability/logger.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

namespace mulegraph {
namespace graph {

std::map<AccountId, std::size_t> CommunityAssignment::toAccountMap(
    const ProjectedGraph& graph) const {
  std::map<AccountId, std::size_t> result;
  for (std::size_t i = 0; i < community_of_node.size(); ++i) {
    result[graph.account(i).id] = community_of_node[i];
  }
  return result;
}

CommunityDetector::CommunityDetector() : CommunityDetector(Config{}) {}

CommunityDetector::CommunityDetector(const Config& config) : config_(config) {
  if (config_.resolution <= 0.0) {
    throw ConfigError("Community resolution must be positive");
  }
  if (config_.max_passes == 0 || config_.max_levels == 0) {
    throw ConfigError("Community detection needs at least one pass and one level");
  }
}

CommunityAssignment CommunityDetector::detect(const ProjectedGraph& graph,
                                              const concurrent::CancellationToken* cancel) const {
  CommunityAssignment result;
  std::size_t n = graph.nodeCount();
  result.community_of_node.resize(n);
  std::iota(result.community_of_node.begin(), result.community_of_node.end(), 0);

  LevelGraph level = fromProjection(graph);
  bool merged_out = false;
  bool pass_limit_hit = false;

  for (std::size_t depth = 0; depth < config_.max_levels; ++depth) {
    concurrent::checkCancelled(cancel, "community detection level " + std::to_string(depth));

    std::vector<std::size_t> labels(level.node_count);
    std::iota(labels.begin(), labels.end(), 0);

    std::size_t moves = 0;
    bool stable = localMoving(level, labels, moves, cancel);
    if (!stable) pass_limit_hit = true;

    std::size_t count = renumber(labels);
    result.levels += 1;
    result.total_moves += moves;

    for (auto& community : result.community_of_node) {
      community = labels[community];
    }

    LOG_BUILDER(observability::LogLevel::DEBUG, "Community detection level finished")
        .field("level", static_cast<std::uint64_t>(depth))
        .field("nodes", static_cast<std::uint64_t>(level.node_count))
        .field("communities", static_cast<std::uint64_t>(count))
        .field("moves", static_cast<std::uint64_t>(moves))
        .field("stable", stable);

    if (count == level.node_count) {
      merged_out = true;
      break;
    }
    level = aggregate(level, labels, count);
  }

  result.community_count = renumber(result.community_of_node);
  result.modularity = modularity(graph, result.community_of_node, config_.resolution);
  result.converged = merged_out && !pass_limit_hit;

  if (!result.converged) {
    LOG_BUILDER(observability::LogLevel::WARN,
                "Community detection did not converge; using best partition found")
        .field("levels", static_cast<std::uint64_t>(result.levels))
        .field("max_levels", static_cast<std::uint64_t>(config_.max_levels))
        .field("max_passes", static_cast<std::uint64_t>(config_.max_passes))
        .field("modularity", result.modularity);
  }

  return result;
}

double CommunityDetector::modularity(const ProjectedGraph& graph,
                                     const std::vector<std::size_t>& community_of_node,
                                     double resolution) {
  double m = graph.totalWeight();
  if (m <= 0.0) return 0.0;

  std::size_t communities = 0;
  for (std::size_t c : community_of_node) communities = std::max(communities, c + 1);

  std::vector<double> internal(communities, 0.0);
  std::vector<double> total(communities, 0.0);

  for (std::size_t i = 0; i < graph.nodeCount(); ++i) {
    total[community_of_node[i]] += graph.weightedDegree(i);
    for (const auto& neighbor : graph.neighbors(i)) {
      if (neighbor.node > i && community_of_node[neighbor.node] == community_of_node[i]) {
        internal[community_of_node[i]] += neighbor.weight;
      }
    }
  }

  double q = 0.0;
  for (std::size_t c = 0; c < communities; ++c) {
    double share = total[c] / (2.0 * m);
    q += internal[c] / m - resolution * share * share;
  }
  return q;
}

CommunityDetector::LevelGraph CommunityDetector::fromProjection(const ProjectedGraph& graph) {
  LevelGraph level;
  level.node_count = graph.nodeCount();
  level.adjacency.resize(level.node_count);
  level.self_loop.assign(level.node_count, 0.0);
  level.degree.assign(level.node_count, 0.0);
  level.total_weight = graph.totalWeight();

  for (std::size_t i = 0; i < level.node_count; ++i) {
    for (const auto& neighbor : graph.neighbors(i)) {
      level.adjacency[i].emplace_back(neighbor.node, neighbor.weight);
    }
    level.degree[i] = graph.weightedDegree(i);
  }
  return level;
}

CommunityDetector::LevelGraph CommunityDetector::aggregate(const LevelGraph& level,
                                                           const std::vector<std::size_t>& labels,
                                                           std::size_t community_count) {
  LevelGraph coarse;
  coarse.node_count = community_count;
  coarse.adjacency.resize(community_count);
  coarse.self_loop.assign(community_count, 0.0);
  coarse.degree.assign(community_count, 0.0);
  coarse.total_weight = level.total_weight;

  std::map<std::pair<std::size_t, std::size_t>, double> between;
  for (std::size_t i = 0; i < level.node_count; ++i) {
    std::size_t ci = labels[i];
    coarse.self_loop[ci] += level.self_loop[i];
    coarse.degree[ci] += level.degree[i];

    for (const auto& [j, w] : level.adjacency[i]) {
      if (j <= i) continue;
      std::size_t cj = labels[j];
      if (ci == cj) {
        coarse.self_loop[ci] += w;
      } else {
        std::pair<std::size_t, std::size_t> key(std::min(ci, cj), std::max(ci, cj));
        between[key] += w;
      }
    }
  }

  for (const auto& [pair, w] : between) {
    coarse.adjacency[pair.first].emplace_back(pair.second, w);
    coarse.adjacency[pair.second].emplace_back(pair.first, w);
  }
  for (auto& list : coarse.adjacency) {
    std::sort(list.begin(), list.end());
  }
  return coarse;
}

std::size_t CommunityDetector::renumber(std::vector<std::size_t>& labels) {
  const std::size_t unassigned = std::numeric_limits<std::size_t>::max();
  std::size_t max_label = 0;
  for (std::size_t label : labels) max_label = std::max(max_label, label);

  std::vector<std::size_t> mapping(labels.empty() ? 0 : max_label + 1, unassigned);
  std::size_t next_id = 0;
  for (auto& label : labels) {
    if (mapping[label] == unassigned) {
      mapping[label] = next_id++;
    }
    label = mapping[label];
  }
  return next_id;
}

bool CommunityDetector::localMoving(const LevelGraph& level, std::vector<std::size_t>& labels,
                                    std::size_t& moves,
                                    const concurrent::CancellationToken* cancel) const {
  const double m = level.total_weight;
  if (m <= 0.0 || level.node_count < 2) return true;

  const double gamma = config_.resolution;
  std::vector<double> community_total(level.degree);
  std::vector<double> weight_to(level.node_count, 0.0);
  std::vector<bool> touched_flag(level.node_count, false);
  std::vector<std::size_t> touched;

  for (std::size_t pass = 0; pass < config_.max_passes; ++pass) {
    concurrent::checkCancelled(cancel, "community detection pass " + std::to_string(pass));
    std::size_t pass_moves = 0;

    for (std::size_t i = 0; i < level.node_count; ++i) {
      const std::size_t current = labels[i];
      const double k_i = level.degree[i];

      touched.clear();
      for (const auto& [j, w] : level.adjacency[i]) {
        std::size_t c = labels[j];
        if (!touched_flag[c]) {
          touched_flag[c] = true;
          touched.push_back(c);
        }
        weight_to[c] += w;
      }

      // Remove i from its community before scoring every candidate, itself included
      community_total[current] -= k_i;

      auto gain = [&](std::size_t c) {
        return (weight_to[c] - gamma * k_i * community_total[c] / (2.0 * m)) / m;
      };

      const double stay_gain = gain(current);
      std::size_t best = current;
      double best_gain = -std::numeric_limits<double>::infinity();

      std::sort(touched.begin(), touched.end());
      for (std::size_t c : touched) {
        if (c == current) continue;
        double g = gain(c);
        if (g > best_gain) {
          best_gain = g;
          best = c;
        }
      }

      if (best != current &&
          !(best_gain > 0.0 && best_gain - stay_gain > config_.tolerance)) {
        best = current;
      }

      community_total[best] += k_i;
      if (best != current) {
        labels[i] = best;
        ++pass_moves;
      }

      for (std::size_t c : touched) {
        weight_to[c] = 0.0;
        touched_flag[c] = false;
      }
    }

    moves += pass_moves;
    if (pass_moves == 0) return true;
  }
  return false;
}

}  // namespace graph
}  // namespace mulegraph
