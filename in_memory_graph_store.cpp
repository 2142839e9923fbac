#include "mulegraph/in_memory_graph_store.hpp"

#include <mutex>

namespace mulegraph {

InMemoryGraphStore::InMemoryGraphStore(std::vector<Account> accounts,
                                       std::vector<TransactionEdge> edges)
    : accounts_(std::move(accounts)), edges_(std::move(edges)) {
}

std::vector<Account> InMemoryGraphStore::loadAccounts() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return accounts_;
}

std::vector<TransactionEdge> InMemoryGraphStore::loadTransactionEdges() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return edges_;
}

std::string InMemoryGraphStore::snapshotVersion() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return std::to_string(version_);
}

void InMemoryGraphStore::addAccount(const Account& account) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  accounts_.push_back(account);
  ++version_;
}

void InMemoryGraphStore::addTransaction(const TransactionEdge& edge) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  edges_.push_back(edge);
  ++version_;
}

bool InMemoryGraphStore::setLabels(AccountId id, std::set<AccountLabel> labels) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  for (auto& account : accounts_) {
    if (account.id == id) {
      account.labels = std::move(labels);
      ++version_;
      return true;
    }
  }
  return false;
}

}  // namespace mulegraph
