#include "mulegraph/database/postgres_connection.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/observability/logger.hpp"

#include <sstream>

namespace mulegraph {
namespace database {

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

bool PostgresConnection::connect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (connection_) {
    disconnectLocked();
  }

  std::stringstream conn_str;
  conn_str << "host=" << config_.host
           << " port=" << config_.port
           << " dbname=" << config_.database
           << " user=" << config_.username
           << " connect_timeout=" << config_.connection_timeout;
  if (!config_.password.empty()) {
    conn_str << " password=" << config_.password;
  }

  connection_ = PQconnectdb(conn_str.str().c_str());

  if (PQstatus(connection_) != CONNECTION_OK) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Database connection failed")
        .field("target", getConnectionInfo())
        .field("error", std::string(PQerrorMessage(connection_)));
    PQfinish(connection_);
    connection_ = nullptr;
    return false;
  }

  LOG_BUILDER(observability::LogLevel::INFO, "Connected to PostgreSQL")
      .field("target", getConnectionInfo());
  return true;
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnectLocked();
}

void PostgresConnection::disconnectLocked() {
  if (!connection_) return;

  if (in_transaction_) {
    PGresult* result = PQexec(connection_, "ROLLBACK");
    if (result) PQclear(result);
    in_transaction_ = false;
  }
  PQfinish(connection_);
  connection_ = nullptr;
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

ResultPtr PostgresConnection::run(const std::string& sql,
                                  const std::vector<std::string>* params) {
  if (!connection_) {
    throw PersistenceError("Not connected to " + getConnectionInfo());
  }

  PGresult* raw = nullptr;
  if (params) {
    std::vector<const char*> values;
    values.reserve(params->size());
    for (const auto& param : *params) values.push_back(param.c_str());
    raw = PQexecParams(connection_, sql.c_str(), static_cast<int>(values.size()), nullptr,
                       values.data(), nullptr, nullptr, 0);
  } else {
    raw = PQexec(connection_, sql.c_str());
  }

  if (!raw) {
    throw PersistenceError("Query execution failed: " + std::string(PQerrorMessage(connection_)));
  }

  ResultPtr result(raw);
  ExecStatusType status = PQresultStatus(raw);
  if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
    throw PersistenceError("Query failed: " + std::string(PQresultErrorMessage(raw)));
  }
  return result;
}

void PostgresConnection::execute(const std::string& statement) {
  std::lock_guard<std::mutex> lock(mutex_);
  run(statement, nullptr);
}

ResultPtr PostgresConnection::query(const std::string& sql) {
  std::lock_guard<std::mutex> lock(mutex_);
  return run(sql, nullptr);
}

ResultPtr PostgresConnection::executeParams(const std::string& sql,
                                            const std::vector<std::string>& params) {
  std::lock_guard<std::mutex> lock(mutex_);
  return run(sql, &params);
}

void PostgresConnection::beginTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (in_transaction_) {
    throw PersistenceError("Transaction already open");
  }
  run("BEGIN", nullptr);
  in_transaction_ = true;
}

void PostgresConnection::commitTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!in_transaction_) {
    throw PersistenceError("No open transaction to commit");
  }
  in_transaction_ = false;
  run("COMMIT", nullptr);
}

void PostgresConnection::rollbackTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!in_transaction_) return;
  in_transaction_ = false;
  run("ROLLBACK", nullptr);
}

bool PostgresConnection::inTransaction() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_transaction_;
}

std::string PostgresConnection::getLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    return "Not connected";
  }

  return PQerrorMessage(connection_);
}

std::string PostgresConnection::getConnectionInfo() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

// TransactionGuard implementation
TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), finished_(false) {
  conn_.beginTransaction();
}

TransactionGuard::~TransactionGuard() {
  if (finished_) return;
  try {
    conn_.rollbackTransaction();
  } catch (const PersistenceError& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Rollback failed").field("error", e.what());
  }
}

void TransactionGuard::commit() {
  if (finished_) return;
  finished_ = true;
  conn_.commitTransaction();
}

void TransactionGuard::rollback() {
  if (finished_) return;
  finished_ = true;
  conn_.rollbackTransaction();
}

}  // namespace database
}  // namespace mulegraph
