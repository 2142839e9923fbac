#include "mulegraph/features/feature_codec.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mulegraph {
namespace features {

namespace {

template <typename T>
nlohmann::ordered_json optionalToJson(const std::optional<T>& value) {
  if (!value) return nullptr;
  return nlohmann::ordered_json(*value);
}

const FeatureGroup kGroups[] = {FeatureGroup::COMMUNITY, FeatureGroup::PROXIMITY,
                                FeatureGroup::DIVERSITY};

}  // namespace

nlohmann::ordered_json FeatureCodec::toJson(const AccountFeatures& features) {
  nlohmann::ordered_json row;
  row["account_id"] = features.account_id;
  row["account_number"] = features.account_number;
  row["confirmed_mule"] = features.confirmed_mule;

  row["community_id"] = optionalToJson(features.community_id);
  row["community_size"] = optionalToJson(features.community_size);
  row["mule_count"] = optionalToJson(features.mule_count);
  row["mule_density"] = optionalToJson(features.mule_density);

  row["distance_to_mule"] = optionalToJson(features.distance_to_mule);
  row["nearest_mule_id"] = optionalToJson(features.nearest_mule_id);
  row["nearest_mule"] = optionalToJson(features.nearest_mule);
  row["tied_mules"] = optionalToJson(features.tied_mules);
  row["mule_path"] = optionalToJson(features.mule_path);

  row["unique_counterparties"] = optionalToJson(features.unique_counterparties);
  row["total_transactions"] = optionalToJson(features.total_transactions);
  row["diversity_ratio"] = optionalToJson(features.diversity_ratio);
  row["top_counterparty_share"] = optionalToJson(features.top_counterparty_share);
  return row;
}

nlohmann::ordered_json FeatureCodec::toJson(const graph::CommunityDensity& community) {
  return nlohmann::ordered_json{{"community_id", community.community_id},
                                {"size", community.community_size},
                                {"mule_count", community.mule_count},
                                {"mule_density", community.mule_density}};
}

nlohmann::ordered_json FeatureCodec::toJson(const FeatureSnapshot& snapshot) {
  nlohmann::ordered_json doc;
  doc["generation"] = snapshot.generation();

  nlohmann::ordered_json computed = nlohmann::ordered_json::object();
  for (FeatureGroup group : kGroups) {
    auto when = snapshot.computedAt(group);
    computed[featureGroupToString(group)] =
        when ? nlohmann::ordered_json(formatTimestamp(*when)) : nlohmann::ordered_json(nullptr);
  }
  doc["computed_at"] = computed;

  nlohmann::ordered_json communities = nlohmann::ordered_json::array();
  for (const auto& community : snapshot.communities()) {
    communities.push_back(toJson(community));
  }
  doc["communities"] = communities;

  nlohmann::ordered_json rows = nlohmann::ordered_json::array();
  for (const auto& row : snapshot.rows()) {
    rows.push_back(toJson(row));
  }
  doc["accounts"] = rows;
  return doc;
}

std::string FeatureCodec::serializeFeatureTable(const FeatureSnapshot& snapshot) {
  nlohmann::ordered_json rows = nlohmann::ordered_json::array();
  for (const auto& row : snapshot.rows()) {
    rows.push_back(toJson(row));
  }
  return rows.dump();
}

std::string FeatureCodec::formatTimestamp(FeatureSnapshot::Clock::time_point when) {
  auto time_t = FeatureSnapshot::Clock::to_time_t(when);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      when.time_since_epoch()) % 1000;

  std::tm tm_buf;
  gmtime_r(&time_t, &tm_buf);

  std::stringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
  return ss.str();
}

}  // namespace features
}  // namespace mulegraph
