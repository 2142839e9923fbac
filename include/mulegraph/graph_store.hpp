#ifndef MULEGRAPH_GRAPH_STORE_HPP_
#define MULEGRAPH_GRAPH_STORE_HPP_

#include "mulegraph/model.hpp"

#include <string>
#include <vector>

namespace mulegraph {

/**
 * Abstract source of the account graph.
 * Each load returns a finite sequence representing a consistent snapshot and
 * may be called again to restart it.
 */
class GraphStore {
 public:
  virtual ~GraphStore() = default;

  /**
   * Returns every account together with its label set.
   */
  virtual std::vector<Account> loadAccounts() = 0;

  /**
   * Returns every transaction edge.
   */
  virtual std::vector<TransactionEdge> loadTransactionEdges() = 0;

  /**
   * Returns an opaque token that changes whenever accounts or edges change.
   * Batches compare it at start and end to detect concurrent mutation.
   */
  virtual std::string snapshotVersion() = 0;
};

}  // namespace mulegraph

#endif  // MULEGRAPH_GRAPH_STORE_HPP_
