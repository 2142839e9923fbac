#include "mulegraph/features/account_features.hpp"
#include "mulegraph/errors.hpp"

#include <algorithm>

namespace mulegraph {
namespace features {

std::string featureGroupToString(FeatureGroup group) {
  switch (group) {
    case FeatureGroup::COMMUNITY: return "community";
    case FeatureGroup::PROXIMITY: return "proximity";
    case FeatureGroup::DIVERSITY: return "diversity";
    default: return "unknown";
  }
}

void AccountFeatures::clearGroup(FeatureGroup group) {
  switch (group) {
    case FeatureGroup::COMMUNITY:
      community_id.reset();
      community_size.reset();
      mule_count.reset();
      mule_density.reset();
      break;
    case FeatureGroup::PROXIMITY:
      distance_to_mule.reset();
      nearest_mule_id.reset();
      nearest_mule.reset();
      tied_mules.reset();
      mule_path.reset();
      break;
    case FeatureGroup::DIVERSITY:
      unique_counterparties.reset();
      total_transactions.reset();
      diversity_ratio.reset();
      top_counterparty_share.reset();
      break;
  }
}

void AccountFeatures::copyGroup(FeatureGroup group, const AccountFeatures& from) {
  switch (group) {
    case FeatureGroup::COMMUNITY:
      community_id = from.community_id;
      community_size = from.community_size;
      mule_count = from.mule_count;
      mule_density = from.mule_density;
      break;
    case FeatureGroup::PROXIMITY:
      distance_to_mule = from.distance_to_mule;
      nearest_mule_id = from.nearest_mule_id;
      nearest_mule = from.nearest_mule;
      tied_mules = from.tied_mules;
      mule_path = from.mule_path;
      break;
    case FeatureGroup::DIVERSITY:
      unique_counterparties = from.unique_counterparties;
      total_transactions = from.total_transactions;
      diversity_ratio = from.diversity_ratio;
      top_counterparty_share = from.top_counterparty_share;
      break;
  }
}

FeatureSnapshot::FeatureSnapshot(std::vector<AccountFeatures> rows) : rows_(std::move(rows)) {
  std::sort(rows_.begin(), rows_.end(), [](const AccountFeatures& a, const AccountFeatures& b) {
    return a.account_id < b.account_id;
  });

  index_by_id_.reserve(rows_.size());
  index_by_number_.reserve(rows_.size());
  for (std::size_t i = 0; i < rows_.size(); ++i) {
    if (!index_by_id_.emplace(rows_[i].account_id, i).second) {
      throw MuleGraphError("Duplicate account id in feature snapshot: " +
                           std::to_string(rows_[i].account_id));
    }
    if (!index_by_number_.emplace(rows_[i].account_number, i).second) {
      throw MuleGraphError("Duplicate account number in feature snapshot: " +
                           rows_[i].account_number);
    }
  }
}

const AccountFeatures* FeatureSnapshot::find(AccountId account_id) const {
  auto it = index_by_id_.find(account_id);
  return it == index_by_id_.end() ? nullptr : &rows_[it->second];
}

const AccountFeatures* FeatureSnapshot::findByNumber(const std::string& account_number) const {
  auto it = index_by_number_.find(account_number);
  return it == index_by_number_.end() ? nullptr : &rows_[it->second];
}

const AccountFeatures& FeatureSnapshot::get(const std::string& account_number) const {
  const AccountFeatures* row = findByNumber(account_number);
  if (!row) {
    throw UnknownAccountError(account_number);
  }
  return *row;
}

std::optional<FeatureSnapshot::Clock::time_point> FeatureSnapshot::computedAt(
    FeatureGroup group) const {
  return computed_at_[static_cast<std::size_t>(group)];
}

void FeatureSnapshot::setComputedAt(FeatureGroup group, Clock::time_point when) {
  computed_at_[static_cast<std::size_t>(group)] = when;
}

void FeatureSnapshot::setCommunities(std::vector<graph::CommunityDensity> communities) {
  communities_ = std::move(communities);
}

}  // namespace features
}  // namespace mulegraph
