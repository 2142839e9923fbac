#ifndef MULEGRAPH_GRAPH_PROJECTION_BUILDER_HPP_
#define MULEGRAPH_GRAPH_PROJECTION_BUILDER_HPP_

#include "mulegraph/model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mulegraph {
namespace graph {

/**
 * Undirected weighted edge between two accounts, lower id first.
 */
struct ProjectedEdge {
  AccountId low;
  AccountId high;
  double weight;
};

struct Neighbor {
  std::size_t node;
  double weight;
};

/**
 * Account-to-account graph derived from transaction edges.
 *
 * Nodes are arena indices 0..n-1 over the accounts sorted by id. Adjacency
 * lists are sorted by neighbor index and never contain self-loops.
 */
class ProjectedGraph {
 public:
  ProjectedGraph() = default;

  std::size_t nodeCount() const { return accounts_.size(); }
  const std::vector<Account>& accounts() const { return accounts_; }
  const Account& account(std::size_t node) const { return accounts_.at(node); }

  std::optional<std::size_t> indexOf(AccountId id) const;
  std::optional<std::size_t> indexOfNumber(const std::string& account_number) const;

  const std::vector<Neighbor>& neighbors(std::size_t node) const { return adjacency_.at(node); }
  double weightedDegree(std::size_t node) const { return degree_.at(node); }

  // Sum of all projected edge weights, each undirected edge counted once
  double totalWeight() const { return total_weight_; }

  const std::vector<ProjectedEdge>& edges() const { return edges_; }

  // Symmetric lookup, 0 when the pair never transacted
  double weight(AccountId a, AccountId b) const;

 private:
  friend class ProjectionBuilder;

  std::vector<Account> accounts_;
  std::unordered_map<AccountId, std::size_t> index_by_id_;
  std::unordered_map<std::string, std::size_t> index_by_number_;
  std::vector<std::vector<Neighbor>> adjacency_;
  std::vector<double> degree_;
  std::vector<ProjectedEdge> edges_;
  double total_weight_ = 0.0;
};

/**
 * Builds the projection: one undirected edge per account pair, weighted by
 * the summed amount of every transaction between the pair in either direction.
 */
class ProjectionBuilder {
 public:
  /**
   * Throws GraphLoadError on duplicate accounts, negative or non-finite
   * amounts, and edges referencing unknown account ids.
   */
  ProjectedGraph build(const std::vector<Account>& accounts,
                       const std::vector<TransactionEdge>& edges) const;
};

}  // namespace graph
}  // namespace mulegraph

#endif  // MULEGRAPH_GRAPH_PROJECTION_BUILDER_HPP_
