#ifndef MULEGRAPH_GRAPH_COMMUNITY_DETECTOR_HPP_
#define MULEGRAPH_GRAPH_COMMUNITY_DETECTOR_HPP_

#include "mulegraph/graph/projection_builder.hpp"

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace mulegraph {
namespace concurrent {
class CancellationToken;
}  // namespace concurrent

namespace graph {

/**
 * Result of community detection over a projected graph.
 */
struct CommunityAssignment {
  // Community id per projected node index; ids are dense, numbered in
  // ascending order of each community's lowest account id.
  std::vector<std::size_t> community_of_node;
  std::size_t community_count = 0;
  double modularity = 0.0;
  std::size_t levels = 0;
  std::size_t total_moves = 0;
  // False when max passes or max levels ran out before the partition stabilized
  bool converged = true;

  std::map<AccountId, std::size_t> toAccountMap(const ProjectedGraph& graph) const;
};

/**
 * Louvain modularity optimization: local moving followed by aggregation of
 * communities into super-nodes, repeated until a level produces no merges.
 * Deterministic: nodes are visited in ascending index order and ties go to
 * the lowest community id.
 */
class CommunityDetector {
 public:
  struct Config {
    double resolution = 1.0;
    // Minimum modularity improvement for a move to be accepted
    double tolerance = 1e-7;
    std::size_t max_passes = 10;
    std::size_t max_levels = 10;
  };

  CommunityDetector();
  explicit CommunityDetector(const Config& config);

  CommunityAssignment detect(const ProjectedGraph& graph,
                             const concurrent::CancellationToken* cancel = nullptr) const;

  /**
   * Modularity of a partition given per-node community ids.
   */
  static double modularity(const ProjectedGraph& graph,
                           const std::vector<std::size_t>& community_of_node,
                           double resolution = 1.0);

  const Config& config() const { return config_; }

 private:
  // Graph at one level of the hierarchy. Self-loops hold intra-community weight.
  struct LevelGraph {
    std::size_t node_count = 0;
    std::vector<std::vector<std::pair<std::size_t, double>>> adjacency;
    std::vector<double> self_loop;
    std::vector<double> degree;
    double total_weight = 0.0;
  };

  static LevelGraph fromProjection(const ProjectedGraph& graph);
  static LevelGraph aggregate(const LevelGraph& level, const std::vector<std::size_t>& labels,
                              std::size_t community_count);
  static std::size_t renumber(std::vector<std::size_t>& labels);

  /**
   * Runs local-moving passes until a pass makes no move or max passes is hit.
   * Returns true if the last pass made no move.
   */
  bool localMoving(const LevelGraph& level, std::vector<std::size_t>& labels,
                   std::size_t& moves, const concurrent::CancellationToken* cancel) const;

  Config config_;
};

}  // namespace graph
}  // namespace mulegraph

#endif  // MULEGRAPH_GRAPH_COMMUNITY_DETECTOR_HPP_
