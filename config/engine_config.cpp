#include "mulegraph/config/engine_config.hpp"
#include "mulegraph/errors.hpp"

#include <fstream>

namespace mulegraph {
namespace config {

namespace {

const nlohmann::json* section(const nlohmann::json& doc, const char* name) {
  auto it = doc.find(name);
  if (it == doc.end()) return nullptr;
  if (!it->is_object()) {
    throw ConfigError(std::string("Section '") + name + "' must be an object");
  }
  return &*it;
}

// Overwrites `target` if the key is present
template <typename T>
void read(const nlohmann::json* obj, const char* section_name, const char* key, T& target) {
  if (!obj) return;
  auto it = obj->find(key);
  if (it == obj->end()) return;
  try {
    target = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Invalid value for ") + section_name + "." + key + ": " +
                      e.what());
  }
}

// Unsigned keys reject negative numbers instead of wrapping
void readCount(const nlohmann::json* obj, const char* section_name, const char* key,
               std::size_t& target) {
  if (!obj) return;
  auto it = obj->find(key);
  if (it == obj->end()) return;
  if (!it->is_number_integer() || it->get<long long>() < 0) {
    throw ConfigError(std::string(section_name) + "." + key +
                      " must be a non-negative integer");
  }
  target = it->get<std::size_t>();
}

}  // namespace

observability::LogLevel logLevelFromString(const std::string& value) {
  if (value == "debug") return observability::LogLevel::DEBUG;
  if (value == "info") return observability::LogLevel::INFO;
  if (value == "warn") return observability::LogLevel::WARN;
  if (value == "error") return observability::LogLevel::ERROR;
  if (value == "fatal") return observability::LogLevel::FATAL;
  throw ConfigError("Unknown log level: " + value);
}

std::string logLevelToString(observability::LogLevel level) {
  switch (level) {
    case observability::LogLevel::DEBUG: return "debug";
    case observability::LogLevel::INFO: return "info";
    case observability::LogLevel::WARN: return "warn";
    case observability::LogLevel::ERROR: return "error";
    case observability::LogLevel::FATAL: return "fatal";
    default: return "info";
  }
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("Configuration document must be a JSON object");
  }

  EngineConfig config;

  if (doc.contains("log_level")) {
    std::string level;
    read(&doc, "root", "log_level", level);
    config.log_level = logLevelFromString(level);
  }

  const nlohmann::json* pipeline = section(doc, "pipeline");
  readCount(pipeline, "pipeline", "worker_threads", config.pipeline.worker_threads);
  readCount(pipeline, "pipeline", "min_items_per_worker", config.pipeline.min_items_per_worker);

  const nlohmann::json* community = section(doc, "community");
  read(community, "community", "resolution", config.pipeline.community.resolution);
  read(community, "community", "tolerance", config.pipeline.community.tolerance);
  readCount(community, "community", "max_passes", config.pipeline.community.max_passes);
  readCount(community, "community", "max_levels", config.pipeline.community.max_levels);

  const nlohmann::json* proximity = section(doc, "proximity");
  readCount(proximity, "proximity", "max_depth", config.pipeline.proximity.max_depth);
  read(proximity, "proximity", "build_paths", config.pipeline.proximity.build_paths);
  config.query.proximity = config.pipeline.proximity;

  const nlohmann::json* store = section(doc, "feature_store");
  std::size_t max_age = static_cast<std::size_t>(config.feature_store.max_feature_age.count());
  readCount(store, "feature_store", "max_feature_age_seconds", max_age);
  config.feature_store.max_feature_age = std::chrono::seconds(max_age);

  const nlohmann::json* query = section(doc, "query");
  read(query, "query", "fresh_diversity", config.query.fresh_diversity);
  read(query, "query", "fresh_proximity", config.query.fresh_proximity);
  read(query, "query", "density_threshold", config.query.density_threshold);
  read(query, "query", "diversity_ratio_threshold", config.query.diversity_ratio_threshold);
  readCount(query, "query", "min_transactions_for_diversity",
            config.query.min_transactions_for_diversity);
  read(query, "query", "concentration_threshold", config.query.concentration_threshold);
  readCount(query, "query", "proximity_hops_threshold", config.query.proximity_hops_threshold);

  const nlohmann::json* db = section(doc, "database");
  read(db, "database", "host", config.database.host);
  read(db, "database", "port", config.database.port);
  read(db, "database", "database", config.database.database);
  read(db, "database", "username", config.database.username);
  read(db, "database", "password", config.database.password);
  read(db, "database", "connection_timeout", config.database.connection_timeout);

  config.validate();
  return config;
}

EngineConfig EngineConfig::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigError("Cannot open configuration file: " + path);
  }

  nlohmann::json doc;
  try {
    file >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("Malformed configuration file " + path + ": " + e.what());
  }
  return fromJson(doc);
}

void EngineConfig::validate() const {
  if (!(pipeline.community.resolution > 0.0)) {
    throw ConfigError("community.resolution must be positive");
  }
  if (pipeline.community.tolerance < 0.0) {
    throw ConfigError("community.tolerance must not be negative");
  }
  if (pipeline.community.max_passes == 0 || pipeline.community.max_levels == 0) {
    throw ConfigError("community.max_passes and community.max_levels must be at least 1");
  }
  if (pipeline.worker_threads == 0) {
    throw ConfigError("pipeline.worker_threads must be at least 1");
  }
  if (query.density_threshold < 0.0 || query.density_threshold > 1.0 ||
      query.diversity_ratio_threshold < 0.0 || query.diversity_ratio_threshold > 1.0 ||
      query.concentration_threshold < 0.0 || query.concentration_threshold > 1.0) {
    throw ConfigError("query thresholds must lie in [0, 1]");
  }
  if (database.port <= 0 || database.port > 65535) {
    throw ConfigError("database.port out of range");
  }
}

nlohmann::json EngineConfig::toJson() const {
  return nlohmann::json{
      {"log_level", logLevelToString(log_level)},
      {"pipeline",
       {{"worker_threads", pipeline.worker_threads},
        {"min_items_per_worker", pipeline.min_items_per_worker}}},
      {"community",
       {{"resolution", pipeline.community.resolution},
        {"tolerance", pipeline.community.tolerance},
        {"max_passes", pipeline.community.max_passes},
        {"max_levels", pipeline.community.max_levels}}},
      {"proximity",
       {{"max_depth", pipeline.proximity.max_depth},
        {"build_paths", pipeline.proximity.build_paths}}},
      {"feature_store", {{"max_feature_age_seconds", feature_store.max_feature_age.count()}}},
      {"query",
       {{"fresh_diversity", query.fresh_diversity},
        {"fresh_proximity", query.fresh_proximity},
        {"density_threshold", query.density_threshold},
        {"diversity_ratio_threshold", query.diversity_ratio_threshold},
        {"min_transactions_for_diversity", query.min_transactions_for_diversity},
        {"concentration_threshold", query.concentration_threshold},
        {"proximity_hops_threshold", query.proximity_hops_threshold}}},
      // Password is never echoed
      {"database",
       {{"host", database.host},
        {"port", database.port},
        {"database", database.database},
        {"username", database.username},
        {"connection_timeout", database.connection_timeout}}}};
}

}  // namespace config
}  // namespace mulegraph
