#ifndef MULEGRAPH_MODEL_HPP_
#define MULEGRAPH_MODEL_HPP_

#include <cstdint>
#include <set>
#include <string>
#include <utility>

namespace mulegraph {

using AccountId = std::uint64_t;

/**
 * Labels an account may carry in the graph store.
 */
enum class AccountLabel {
  INTERNAL,
  EXTERNAL,
  HIGH_RISK_JURISDICTION,
  FLAGGED,
  CONFIRMED_MULE
};

/**
 * Kind of entity sitting at either end of a transaction edge.
 * Only ACCOUNT endpoints take part in the projected graph.
 */
enum class EntityKind {
  ACCOUNT,
  OTHER
};

struct Account {
  AccountId id = 0;
  std::string account_number;
  std::set<AccountLabel> labels;

  Account() = default;
  Account(AccountId account_id, const std::string& number,
          std::set<AccountLabel> account_labels = {})
      : id(account_id), account_number(number), labels(std::move(account_labels)) {}

  bool hasLabel(AccountLabel label) const { return labels.count(label) > 0; }
  bool isConfirmedMule() const { return hasLabel(AccountLabel::CONFIRMED_MULE); }
};

/**
 * Directed transaction performer -> beneficiary.
 */
struct TransactionEdge {
  AccountId performer = 0;
  AccountId beneficiary = 0;
  double amount = 0.0;
  std::int64_t timestamp = 0;
  EntityKind performer_kind = EntityKind::ACCOUNT;
  EntityKind beneficiary_kind = EntityKind::ACCOUNT;

  TransactionEdge() = default;
  TransactionEdge(AccountId from, AccountId to, double amt, std::int64_t ts = 0,
                  EntityKind from_kind = EntityKind::ACCOUNT,
                  EntityKind to_kind = EntityKind::ACCOUNT)
      : performer(from), beneficiary(to), amount(amt), timestamp(ts),
        performer_kind(from_kind), beneficiary_kind(to_kind) {}

  bool betweenAccounts() const {
    return performer_kind == EntityKind::ACCOUNT && beneficiary_kind == EntityKind::ACCOUNT;
  }
};

std::string labelToString(AccountLabel label);
AccountLabel labelFromString(const std::string& value);

}  // namespace mulegraph

#endif  // MULEGRAPH_MODEL_HPP_
