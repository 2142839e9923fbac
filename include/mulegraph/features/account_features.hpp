#ifndef MULEGRAPH_FEATURES_ACCOUNT_FEATURES_HPP_
#define MULEGRAPH_FEATURES_ACCOUNT_FEATURES_HPP_

#include "mulegraph/graph/density_aggregator.hpp"
#include "mulegraph/model.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mulegraph {
namespace features {

/**
 * Features produced by one batch job.
 */
enum class FeatureGroup {
  COMMUNITY,
  PROXIMITY,
  DIVERSITY
};

constexpr std::size_t kFeatureGroupCount = 3;

std::string featureGroupToString(FeatureGroup group);

/**
 * Feature record of one account. Every feature stays unset until the batch
 * job owning its group has run.
 */
struct AccountFeatures {
  AccountId account_id = 0;
  std::string account_number;
  bool confirmed_mule = false;

  // Community group
  std::optional<std::size_t> community_id;
  std::optional<std::size_t> community_size;
  std::optional<std::size_t> mule_count;
  std::optional<double> mule_density;

  // Proximity group
  std::optional<std::size_t> distance_to_mule;
  std::optional<AccountId> nearest_mule_id;
  std::optional<std::string> nearest_mule;
  std::optional<std::vector<std::string>> tied_mules;
  std::optional<std::vector<std::string>> mule_path;

  // Diversity group
  std::optional<std::size_t> unique_counterparties;
  std::optional<std::size_t> total_transactions;
  std::optional<double> diversity_ratio;
  std::optional<double> top_counterparty_share;

  AccountFeatures() = default;
  explicit AccountFeatures(const Account& account)
      : account_id(account.id), account_number(account.account_number),
        confirmed_mule(account.isConfirmedMule()) {}

  void clearGroup(FeatureGroup group);
  void copyGroup(FeatureGroup group, const AccountFeatures& from);
};

/**
 * Immutable feature table published as one generation.
 *
 * Rows are sorted by account id and indexed by id and account number.
 * Built by the pipeline, then handed to FeatureStore::publish().
 */
class FeatureSnapshot {
 public:
  using Clock = std::chrono::system_clock;

  FeatureSnapshot() = default;

  /**
   * Throws MuleGraphError on duplicate account ids or numbers.
   */
  explicit FeatureSnapshot(std::vector<AccountFeatures> rows);

  std::size_t size() const { return rows_.size(); }
  const std::vector<AccountFeatures>& rows() const { return rows_; }

  const AccountFeatures* find(AccountId account_id) const;
  const AccountFeatures* findByNumber(const std::string& account_number) const;

  // Throws UnknownAccountError
  const AccountFeatures& get(const std::string& account_number) const;

  std::uint64_t generation() const { return generation_; }

  std::optional<Clock::time_point> computedAt(FeatureGroup group) const;
  void setComputedAt(FeatureGroup group, Clock::time_point when);

  // Community summaries, most suspicious first
  const std::vector<graph::CommunityDensity>& communities() const { return communities_; }
  void setCommunities(std::vector<graph::CommunityDensity> communities);

 private:
  friend class FeatureStore;

  std::vector<AccountFeatures> rows_;
  std::unordered_map<AccountId, std::size_t> index_by_id_;
  std::unordered_map<std::string, std::size_t> index_by_number_;
  std::vector<graph::CommunityDensity> communities_;
  std::array<std::optional<Clock::time_point>, kFeatureGroupCount> computed_at_;
  std::uint64_t generation_ = 0;
};

}  // namespace features
}  // namespace mulegraph

#endif  // MULEGRAPH_FEATURES_ACCOUNT_FEATURES_HPP_
