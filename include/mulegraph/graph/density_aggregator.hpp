#ifndef MULEGRAPH_GRAPH_DENSITY_AGGREGATOR_HPP_
#define MULEGRAPH_GRAPH_DENSITY_AGGREGATOR_HPP_

#include "mulegraph/graph/community_detector.hpp"
#include "mulegraph/model.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace mulegraph {
namespace graph {

struct CommunityDensity {
  std::size_t community_id = 0;
  std::size_t community_size = 0;
  std::size_t mule_count = 0;
  // mule_count / community_size rounded to four places
  double mule_density = 0.0;
};

struct DensityResult {
  std::map<AccountId, CommunityDensity> by_account;
  // One entry per community, most suspicious first
  std::vector<CommunityDensity> communities;
};

/**
 * Per-community size, confirmed-mule count and density, written back to
 * every member account.
 */
class DensityAggregator {
 public:
  DensityResult aggregate(const ProjectedGraph& graph,
                          const CommunityAssignment& assignment) const;

  /**
   * Same aggregation from an explicit account -> community mapping.
   * Throws MuleGraphError if an account has no community or a mapped
   * account is not in the account list.
   */
  DensityResult aggregate(const std::map<AccountId, std::size_t>& communities,
                          const std::vector<Account>& accounts) const;
};

}  // namespace graph
}  // namespace mulegraph

#endif  // MULEGRAPH_GRAPH_DENSITY_AGGREGATOR_HPP_
