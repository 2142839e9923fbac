#ifndef MULEGRAPH_CONFIG_ENGINE_CONFIG_HPP_
#define MULEGRAPH_CONFIG_ENGINE_CONFIG_HPP_

#include "mulegraph/database/postgres_connection.hpp"
#include "mulegraph/features/feature_pipeline.hpp"
#include "mulegraph/features/feature_store.hpp"
#include "mulegraph/features/query_service.hpp"
#include "mulegraph/observability/logger.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace mulegraph {
namespace config {

/**
 * Configuration of every engine component. Missing keys keep their defaults.
 *
 * {
 *   "log_level": "info",
 *   "pipeline": {"worker_threads": 4, "min_items_per_worker": 256},
 *   "community": {"resolution": 1.0, "tolerance": 1e-7, "max_passes": 10, "max_levels": 10},
 *   "proximity": {"max_depth": 10, "build_paths": true},
 *   "feature_store": {"max_feature_age_seconds": 0},
 *   "query": {"fresh_diversity": true, "fresh_proximity": false, "density_threshold": 0.2, ...},
 *   "database": {"host": "localhost", "port": 5432, "database": "mulegraph", ...}
 * }
 */
struct EngineConfig {
  observability::LogLevel log_level = observability::LogLevel::INFO;
  features::FeaturePipeline::Config pipeline;
  features::FeatureStore::Config feature_store;
  features::QueryService::Config query;
  database::PostgresConnection::Config database;

  /**
   * Throws ConfigError on type mismatches, unknown log levels and
   * out-of-range values.
   */
  static EngineConfig fromJson(const nlohmann::json& doc);
  static EngineConfig loadFromFile(const std::string& path);

  nlohmann::json toJson() const;

  void validate() const;
};

observability::LogLevel logLevelFromString(const std::string& value);
std::string logLevelToString(observability::LogLevel level);

}  // namespace config
}  // namespace mulegraph

#endif  // MULEGRAPH_CONFIG_ENGINE_CONFIG_HPP_
