#ifndef MULEGRAPH_FEATURES_FEATURE_CODEC_HPP_
#define MULEGRAPH_FEATURES_FEATURE_CODEC_HPP_

#include "mulegraph/features/account_features.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace mulegraph {
namespace features {

/**
 * JSON encoding of feature records and snapshots.
 * Unset features are written as null; keys keep declaration order.
 */
class FeatureCodec {
 public:
  static nlohmann::ordered_json toJson(const AccountFeatures& features);

  /**
   * Full snapshot document: generation, per-group computed_at, community
   * summaries and rows.
   */
  static nlohmann::ordered_json toJson(const FeatureSnapshot& snapshot);

  /**
   * Rows only, without generation or timestamps. Two batches over the same
   * graph produce identical strings.
   */
  static std::string serializeFeatureTable(const FeatureSnapshot& snapshot);

  static nlohmann::ordered_json toJson(const graph::CommunityDensity& community);

  // ISO-8601 UTC with millisecond precision
  static std::string formatTimestamp(FeatureSnapshot::Clock::time_point when);
};

}  // namespace features
}  // namespace mulegraph

#endif  // MULEGRAPH_FEATURES_FEATURE_CODEC_HPP_
