#include "mulegraph/database/postgres_graph_store.hpp"
#include "mulegraph/errors.hpp"
#include "mulegraph/observability/logger.hpp"

#include <stdexcept>
#include <string>
#include <unordered_map>

namespace mulegraph {
namespace database {

namespace {

EntityKind kindFromString(const std::string& value) {
  if (value == "account") return EntityKind::ACCOUNT;
  if (value == "other") return EntityKind::OTHER;
  throw GraphLoadError("Unknown entity kind: " + value);
}

template <typename Fn>
auto parseField(const char* column, const char* raw, Fn parse) -> decltype(parse(std::string())) {
  try {
    return parse(std::string(raw));
  } catch (const std::invalid_argument&) {
    throw GraphLoadError(std::string("Malformed value in column ") + column + ": " + raw);
  } catch (const std::out_of_range&) {
    throw GraphLoadError(std::string("Out of range value in column ") + column + ": " + raw);
  }
}

AccountId parseId(const char* column, const char* raw) {
  return parseField(column, raw, [](const std::string& s) {
    return static_cast<AccountId>(std::stoull(s));
  });
}

}  // namespace

PostgresGraphStore::PostgresGraphStore(std::shared_ptr<PostgresConnection> conn)
    : conn_(std::move(conn)) {
}

std::vector<Account> PostgresGraphStore::loadAccounts() {
  ResultPtr rows = conn_->query(
      "SELECT account_id, account_number FROM accounts ORDER BY account_id");

  std::vector<Account> accounts;
  std::unordered_map<AccountId, std::size_t> slot;
  int count = PQntuples(rows.get());
  accounts.reserve(count);
  for (int i = 0; i < count; ++i) {
    AccountId id = parseId("account_id", PQgetvalue(rows.get(), i, 0));
    slot[id] = accounts.size();
    accounts.emplace_back(id, PQgetvalue(rows.get(), i, 1));
  }

  ResultPtr labels = conn_->query(
      "SELECT account_id, label FROM account_labels ORDER BY account_id, label");
  int label_count = PQntuples(labels.get());
  for (int i = 0; i < label_count; ++i) {
    AccountId id = parseId("account_id", PQgetvalue(labels.get(), i, 0));
    auto it = slot.find(id);
    if (it == slot.end()) {
      throw GraphLoadError("Label references unknown account " + std::to_string(id));
    }
    accounts[it->second].labels.insert(labelFromString(PQgetvalue(labels.get(), i, 1)));
  }

  LOG_BUILDER(observability::LogLevel::DEBUG, "Loaded accounts")
      .field("accounts", static_cast<std::uint64_t>(accounts.size()))
      .field("labels", label_count);
  return accounts;
}

std::vector<TransactionEdge> PostgresGraphStore::loadTransactionEdges() {
  ResultPtr rows = conn_->query(R"(
    SELECT performer_id, performer_kind, beneficiary_id, beneficiary_kind, amount, occurred_at
    FROM transactions
    ORDER BY transaction_id
  )");

  std::vector<TransactionEdge> edges;
  int count = PQntuples(rows.get());
  edges.reserve(count);
  for (int i = 0; i < count; ++i) {
    TransactionEdge edge;
    edge.performer = parseId("performer_id", PQgetvalue(rows.get(), i, 0));
    edge.performer_kind = kindFromString(PQgetvalue(rows.get(), i, 1));
    edge.beneficiary = parseId("beneficiary_id", PQgetvalue(rows.get(), i, 2));
    edge.beneficiary_kind = kindFromString(PQgetvalue(rows.get(), i, 3));
    edge.amount = parseField("amount", PQgetvalue(rows.get(), i, 4),
                             [](const std::string& s) { return std::stod(s); });
    edge.timestamp = parseField("occurred_at", PQgetvalue(rows.get(), i, 5),
                                [](const std::string& s) {
                                  return static_cast<std::int64_t>(std::stoll(s));
                                });
    edges.push_back(edge);
  }

  LOG_BUILDER(observability::LogLevel::DEBUG, "Loaded transaction edges")
      .field("edges", static_cast<std::uint64_t>(edges.size()));
  return edges;
}

const char* PostgresGraphStore::snapshotVersionQuery() {
  return R"(
    SELECT
      (SELECT count(*) || ':' ||
              md5(coalesce(string_agg(account_id || '=' || account_number, ','
                                      ORDER BY account_id), ''))
         FROM accounts) || ':' ||
      (SELECT md5(coalesce(string_agg(account_id || '=' || label, ','
                                      ORDER BY account_id, label), ''))
         FROM account_labels) || ':' ||
      (SELECT count(*) || ':' ||
              md5(coalesce(string_agg(transaction_id || '=' ||
                                      performer_id || '/' || performer_kind || '>' ||
                                      beneficiary_id || '/' || beneficiary_kind || '@' ||
                                      amount || '#' || occurred_at, ','
                                      ORDER BY transaction_id), ''))
         FROM transactions)
  )";
}

std::string PostgresGraphStore::snapshotVersion() {
  ResultPtr row = conn_->query(snapshotVersionQuery());
  if (PQntuples(row.get()) != 1) {
    throw PersistenceError("Snapshot version query returned no row");
  }
  return PQgetvalue(row.get(), 0, 0);
}

}  // namespace database
}  // namespace mulegraph
