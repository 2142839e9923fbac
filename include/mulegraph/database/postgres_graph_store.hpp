#ifndef MULEGRAPH_DATABASE_POSTGRES_GRAPH_STORE_HPP_
#define MULEGRAPH_DATABASE_POSTGRES_GRAPH_STORE_HPP_

#include "mulegraph/database/postgres_connection.hpp"
#include "mulegraph/graph_store.hpp"

#include <memory>

namespace mulegraph {
namespace database {

/**
 * GraphStore backed by the accounts, account_labels and transactions tables.
 * Query failures surface as PersistenceError, malformed rows as GraphLoadError.
 */
class PostgresGraphStore : public GraphStore {
 public:
  explicit PostgresGraphStore(std::shared_ptr<PostgresConnection> conn);

  std::vector<Account> loadAccounts() override;
  std::vector<TransactionEdge> loadTransactionEdges() override;

  // Row counts plus an md5 digest over every loaded column of each table, so
  // updates in place change the version as well as inserts and deletes
  std::string snapshotVersion() override;

  static const char* snapshotVersionQuery();

 private:
  std::shared_ptr<PostgresConnection> conn_;
};

}  // namespace database
}  // namespace mulegraph

#endif  // MULEGRAPH_DATABASE_POSTGRES_GRAPH_STORE_HPP_
