#ifndef MULEGRAPH_TESTS_TEST_FIXTURES_HPP_
#define MULEGRAPH_TESTS_TEST_FIXTURES_HPP_

#include "mulegraph/model.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mulegraph {
namespace fixtures {

inline Account account(AccountId id, const std::string& number, bool mule = false) {
  std::set<AccountLabel> labels = {AccountLabel::INTERNAL};
  if (mule) labels.insert(AccountLabel::CONFIRMED_MULE);
  return Account(id, number, labels);
}

inline TransactionEdge transfer(AccountId from, AccountId to, double amount = 1.0) {
  return TransactionEdge(from, to, amount);
}

struct Graph {
  std::vector<Account> accounts;
  std::vector<TransactionEdge> edges;
};

// A -> B (10), B -> M (5), C without transactions; M is a confirmed mule
inline Graph muleChain() {
  Graph g;
  g.accounts = {account(1, "A"), account(2, "B"), account(3, "C"), account(4, "M", true)};
  g.edges = {transfer(1, 2, 10.0), transfer(2, 4, 5.0)};
  return g;
}

// Two disconnected triangles: 1-2-3 all mules, 4-5-6 clean
inline Graph twoTriangles() {
  Graph g;
  g.accounts = {account(1, "T1", true), account(2, "T2", true), account(3, "T3", true),
                account(4, "T4"), account(5, "T5"), account(6, "T6")};
  g.edges = {transfer(1, 2), transfer(2, 3), transfer(3, 1),
             transfer(4, 5), transfer(5, 6), transfer(6, 4)};
  return g;
}

// Deterministic pseudo-random graph; every tenth account is a mule
inline Graph randomGraph(std::size_t accounts, std::size_t edges, std::uint32_t seed) {
  Graph g;
  for (std::size_t i = 1; i <= accounts; ++i) {
    std::string number = "ACC" + std::string(i < 10 ? "00" : (i < 100 ? "0" : "")) +
                         std::to_string(i);
    g.accounts.push_back(account(i, number, i % 10 == 0));
  }

  std::uint32_t state = seed;
  auto next = [&state]() {
    state = state * 1664525u + 1013904223u;
    return state >> 8;
  };
  for (std::size_t k = 0; k < edges; ++k) {
    AccountId from = 1 + next() % accounts;
    AccountId to = 1 + next() % accounts;
    if (from == to) continue;
    g.edges.push_back(transfer(from, to, 1.0 + next() % 100));
  }
  return g;
}

}  // namespace fixtures
}  // namespace mulegraph

#endif  // MULEGRAPH_TESTS_TEST_FIXTURES_HPP_
