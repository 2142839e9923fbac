#ifndef MULEGRAPH_IN_MEMORY_GRAPH_STORE_HPP_
#define MULEGRAPH_IN_MEMORY_GRAPH_STORE_HPP_

#include "mulegraph/graph_store.hpp"

#include <cstdint>
#include <shared_mutex>
#include <vector>

namespace mulegraph {

/**
 * In-memory GraphStore. Mutations bump the snapshot version so running
 * batches can detect them.
 */
class InMemoryGraphStore : public GraphStore {
 public:
  InMemoryGraphStore() = default;
  InMemoryGraphStore(std::vector<Account> accounts, std::vector<TransactionEdge> edges);

  std::vector<Account> loadAccounts() override;
  std::vector<TransactionEdge> loadTransactionEdges() override;
  std::string snapshotVersion() override;

  void addAccount(const Account& account);
  void addTransaction(const TransactionEdge& edge);

  /**
   * Replaces the label set of an existing account. Returns false if the id is unknown.
   */
  bool setLabels(AccountId id, std::set<AccountLabel> labels);

 private:
  std::vector<Account> accounts_;
  std::vector<TransactionEdge> edges_;
  std::uint64_t version_ = 0;
  mutable std::shared_mutex mutex_;
};

}  // namespace mulegraph

#endif  // MULEGRAPH_IN_MEMORY_GRAPH_STORE_HPP_
