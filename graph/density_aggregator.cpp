#include "mulegraph/graph/density_aggregator.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/graph/feature_math.hpp"

#include <algorithm>

namespace mulegraph {
namespace graph {

DensityResult DensityAggregator::aggregate(const ProjectedGraph& graph,
                                           const CommunityAssignment& assignment) const {
  return aggregate(assignment.toAccountMap(graph), graph.accounts());
}

DensityResult DensityAggregator::aggregate(const std::map<AccountId, std::size_t>& communities,
                                           const std::vector<Account>& accounts) const {
  if (communities.size() != accounts.size()) {
    throw MuleGraphError("Community mapping covers " + std::to_string(communities.size()) +
                         " accounts, expected " + std::to_string(accounts.size()));
  }

  std::map<std::size_t, CommunityDensity> totals;
  for (const auto& account : accounts) {
    auto it = communities.find(account.id);
    if (it == communities.end()) {
      throw MuleGraphError("Account " + account.account_number + " has no community");
    }
    auto& community = totals[it->second];
    community.community_id = it->second;
    community.community_size += 1;
    if (account.isConfirmedMule()) {
      community.mule_count += 1;
    }
  }

  DensityResult result;
  for (auto& [id, community] : totals) {
    community.mule_density = safeRatio(community.mule_count, community.community_size);
    result.communities.push_back(community);
  }

  for (const auto& [account_id, community_id] : communities) {
    result.by_account[account_id] = totals.at(community_id);
  }

  std::sort(result.communities.begin(), result.communities.end(),
            [](const CommunityDensity& a, const CommunityDensity& b) {
              if (a.mule_density != b.mule_density) return a.mule_density > b.mule_density;
              if (a.community_size != b.community_size) return a.community_size > b.community_size;
              return a.community_id < b.community_id;
            });
  return result;
}

}  // namespace graph
}  // namespace mulegraph
