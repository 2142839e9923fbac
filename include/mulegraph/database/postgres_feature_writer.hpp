#ifndef MULEGRAPH_DATABASE_POSTGRES_FEATURE_WRITER_HPP_
#define MULEGRAPH_DATABASE_POSTGRES_FEATURE_WRITER_HPP_

#include "mulegraph/database/postgres_connection.hpp"
#include "mulegraph/features/feature_writer.hpp"

#include <memory>
#include <string>

namespace mulegraph {
namespace database {

/**
 * Writes each published generation to account_features in one transaction
 * and records it in feature_generations.
 */
class PostgresFeatureWriter : public features::FeatureSnapshotWriter {
 public:
  explicit PostgresFeatureWriter(std::shared_ptr<PostgresConnection> conn);

  /**
   * Throws PersistenceError; the transaction is rolled back.
   */
  void commitFeatureSnapshot(const features::FeatureSnapshot& snapshot) override;

  /**
   * Executes the statements of a schema file (database/schema.sql).
   */
  void initializeSchema(const std::string& schema_path);

 private:
  std::shared_ptr<PostgresConnection> conn_;
};

}  // namespace database
}  // namespace mulegraph

#endif  // MULEGRAPH_DATABASE_POSTGRES_FEATURE_WRITER_HPP_
