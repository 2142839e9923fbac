#ifndef MULEGRAPH_DATABASE_POSTGRES_CONNECTION_HPP_
#define MULEGRAPH_DATABASE_POSTGRES_CONNECTION_HPP_

#include <libpq-fe.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mulegraph {
namespace database {

struct ResultDeleter {
  void operator()(PGresult* result) const { PQclear(result); }
};

// Owned query result, cleared on destruction
using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

/**
 * PostgreSQL database connection wrapper.
 * Handles connection management and query execution. Failed queries throw
 * PersistenceError carrying the server message.
 */
class PostgresConnection {
 public:
  /**
   * Connection configuration
   */
  struct Config {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "mulegraph";
    std::string username = "mulegraph";
    std::string password = "";
    int connection_timeout = 30;  // seconds
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database. Returns false and logs on failure.
   */
  bool connect();

  void disconnect();

  bool isConnected() const;

  /**
   * Execute a statement that returns no rows.
   */
  void execute(const std::string& statement);

  /**
   * Execute a query and return its rows.
   */
  ResultPtr query(const std::string& sql);

  /**
   * Execute a parameterized statement; parameters are sent as text.
   */
  ResultPtr executeParams(const std::string& sql, const std::vector<std::string>& params);

  void beginTransaction();
  void commitTransaction();
  void rollbackTransaction();

  bool inTransaction() const;

  std::string getLastError() const;

  /**
   * Get connection info for logging, without the password.
   */
  std::string getConnectionInfo() const;

 private:
  ResultPtr run(const std::string& sql, const std::vector<std::string>* params);
  void disconnectLocked();

  Config config_;
  PGconn* connection_;
  mutable std::mutex mutex_;
  bool in_transaction_;
};

/**
 * RAII wrapper for database transactions. Rolls back unless committed.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  void commit();
  void rollback();

 private:
  PostgresConnection& conn_;
  bool finished_;
};

}  // namespace database
}  // namespace mulegraph

#endif  // MULEGRAPH_DATABASE_POSTGRES_CONNECTION_HPP_
