#include "mulegraph/database/postgres_feature_writer.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/features/feature_codec.hpp"
#include "mulegraph/observability/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <sstream>
#include <vector>

namespace mulegraph {
namespace database {

namespace {

// Unset values travel as empty strings and are turned into NULL by NULLIF
template <typename T>
std::string param(const std::optional<T>& value) {
  if (!value) return "";
  std::ostringstream ss;
  ss.precision(17);
  ss << *value;
  return ss.str();
}

std::string param(const std::optional<std::vector<std::string>>& value) {
  if (!value) return "";
  return nlohmann::json(*value).dump();
}

std::string timestampParam(const features::FeatureSnapshot& snapshot,
                           features::FeatureGroup group) {
  auto when = snapshot.computedAt(group);
  return when ? features::FeatureCodec::formatTimestamp(*when) : std::string();
}

const char* kUpsertFeatures = R"(
  INSERT INTO account_features (
    account_id, account_number, generation, confirmed_mule,
    community_id, community_size, mule_count, mule_density,
    distance_to_mule, nearest_mule_id, nearest_mule, tied_mules, mule_path,
    unique_counterparties, total_transactions, diversity_ratio, top_counterparty_share)
  VALUES (
    $1::BIGINT, $2, $3::BIGINT, $4::BOOLEAN,
    NULLIF($5, '')::BIGINT, NULLIF($6, '')::BIGINT, NULLIF($7, '')::BIGINT,
    NULLIF($8, '')::DOUBLE PRECISION,
    NULLIF($9, '')::INTEGER, NULLIF($10, '')::BIGINT, NULLIF($11, ''),
    NULLIF($12, '')::JSONB, NULLIF($13, '')::JSONB,
    NULLIF($14, '')::BIGINT, NULLIF($15, '')::BIGINT,
    NULLIF($16, '')::DOUBLE PRECISION, NULLIF($17, '')::DOUBLE PRECISION)
  ON CONFLICT (account_id) DO UPDATE SET
    account_number = EXCLUDED.account_number,
    generation = EXCLUDED.generation,
    confirmed_mule = EXCLUDED.confirmed_mule,
    community_id = EXCLUDED.community_id,
    community_size = EXCLUDED.community_size,
    mule_count = EXCLUDED.mule_count,
    mule_density = EXCLUDED.mule_density,
    distance_to_mule = EXCLUDED.distance_to_mule,
    nearest_mule_id = EXCLUDED.nearest_mule_id,
    nearest_mule = EXCLUDED.nearest_mule,
    tied_mules = EXCLUDED.tied_mules,
    mule_path = EXCLUDED.mule_path,
    unique_counterparties = EXCLUDED.unique_counterparties,
    total_transactions = EXCLUDED.total_transactions,
    diversity_ratio = EXCLUDED.diversity_ratio,
    top_counterparty_share = EXCLUDED.top_counterparty_share,
    updated_at = CURRENT_TIMESTAMP
)";

}  // namespace

PostgresFeatureWriter::PostgresFeatureWriter(std::shared_ptr<PostgresConnection> conn)
    : conn_(std::move(conn)) {
}

void PostgresFeatureWriter::commitFeatureSnapshot(const features::FeatureSnapshot& snapshot) {
  using features::FeatureGroup;

  TransactionGuard transaction(*conn_);

  conn_->executeParams(R"(
    INSERT INTO feature_generations (generation, account_count, community_computed_at,
                                     proximity_computed_at, diversity_computed_at)
    VALUES ($1::BIGINT, $2::BIGINT, NULLIF($3, '')::TIMESTAMPTZ,
            NULLIF($4, '')::TIMESTAMPTZ, NULLIF($5, '')::TIMESTAMPTZ)
  )",
                       {std::to_string(snapshot.generation()), std::to_string(snapshot.size()),
                        timestampParam(snapshot, FeatureGroup::COMMUNITY),
                        timestampParam(snapshot, FeatureGroup::PROXIMITY),
                        timestampParam(snapshot, FeatureGroup::DIVERSITY)});

  for (const auto& row : snapshot.rows()) {
    conn_->executeParams(kUpsertFeatures,
                         {std::to_string(row.account_id), row.account_number,
                          std::to_string(snapshot.generation()),
                          row.confirmed_mule ? "true" : "false",
                          param(row.community_id), param(row.community_size),
                          param(row.mule_count), param(row.mule_density),
                          param(row.distance_to_mule), param(row.nearest_mule_id),
                          param(row.nearest_mule), param(row.tied_mules), param(row.mule_path),
                          param(row.unique_counterparties), param(row.total_transactions),
                          param(row.diversity_ratio), param(row.top_counterparty_share)});
  }

  // Accounts that left the graph keep no stale features
  conn_->executeParams("DELETE FROM account_features WHERE generation <> $1::BIGINT",
                       {std::to_string(snapshot.generation())});

  transaction.commit();

  LOG_BUILDER(observability::LogLevel::INFO, "Committed feature snapshot")
      .field("generation", static_cast<std::uint64_t>(snapshot.generation()))
      .field("accounts", static_cast<std::uint64_t>(snapshot.size()));
}

void PostgresFeatureWriter::initializeSchema(const std::string& schema_path) {
  std::ifstream file(schema_path);
  if (!file) {
    throw PersistenceError("Cannot open schema file: " + schema_path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  conn_->execute(buffer.str());

  LOG_BUILDER(observability::LogLevel::INFO, "Database schema initialized")
      .field("schema", schema_path);
}

}  // namespace database
}  // namespace mulegraph
