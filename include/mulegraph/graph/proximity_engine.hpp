#ifndef MULEGRAPH_GRAPH_PROXIMITY_ENGINE_HPP_
#define MULEGRAPH_GRAPH_PROXIMITY_ENGINE_HPP_

#include "mulegraph/graph/projection_builder.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mulegraph {
namespace concurrent {
class CancellationToken;
class ParallelExecutor;
}  // namespace concurrent

namespace graph {

/**
 * Hop distance from an account to the closest confirmed mules.
 * All fields stay empty when no mule is reachable within the depth bound.
 */
struct ProximityRecord {
  std::optional<std::size_t> distance;
  std::optional<AccountId> nearest_mule_id;
  std::optional<std::string> nearest_mule;
  // Every mule at the minimal distance, sorted by account number
  std::vector<std::string> tied_mules;
  // Account numbers from the account itself to nearest_mule
  std::vector<std::string> path;

  bool reached() const { return distance.has_value(); }
};

/**
 * Bounded breadth-first search over the projected graph.
 *
 * computeAll() seeds every confirmed mule at distance 0 and expands one level
 * at a time; candidates of a level are evaluated in parallel and each account
 * is assigned exactly once, at its minimal level. computeForAccount() answers
 * the same question for a single account by searching outward from it.
 */
class ProximityEngine {
 public:
  struct Config {
    std::size_t max_depth = 10;
    bool build_paths = true;
  };

  ProximityEngine();
  explicit ProximityEngine(const Config& config,
                           const concurrent::ParallelExecutor* executor = nullptr);

  std::map<AccountId, ProximityRecord> computeAll(
      const ProjectedGraph& graph, const std::vector<AccountId>& mule_ids,
      const concurrent::CancellationToken* cancel = nullptr) const;

  /**
   * Throws UnknownAccountError if the account is not in the graph.
   */
  ProximityRecord computeForAccount(const ProjectedGraph& graph,
                                    const std::vector<AccountId>& mule_ids,
                                    AccountId account) const;
  ProximityRecord computeForAccount(const ProjectedGraph& graph,
                                    const std::vector<AccountId>& mule_ids,
                                    AccountId account, std::size_t max_depth) const;

  /**
   * Ids of every account labeled confirmed-mule, ascending.
   */
  static std::vector<AccountId> confirmedMules(const ProjectedGraph& graph);

  const Config& config() const { return config_; }

 private:
  std::vector<std::size_t> resolveMules(const ProjectedGraph& graph,
                                        const std::vector<AccountId>& mule_ids) const;

  Config config_;
  const concurrent::ParallelExecutor* executor_;
};

}  // namespace graph
}  // namespace mulegraph

#endif  // MULEGRAPH_GRAPH_PROXIMITY_ENGINE_HPP_
