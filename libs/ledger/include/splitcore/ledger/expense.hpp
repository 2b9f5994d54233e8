#pragma once

#include <optional>
#include <span>
#include <string>

#include "splitcore/accounts/roster.hpp"
#include "splitcore/common/status.hpp"
#include "splitcore/common/types.hpp"
#include "splitcore/split/split_policy.hpp"

namespace splitcore {
namespace ledger {

struct ExpenseBuildResult;

// One spend event and its computed split. Immutable once built.
class Expense {
 public:
  // Runs the policy and checks its output (members only, each share in
  // [0, amount], summing exactly to amount). Policy rejections pass through
  // unchanged.
  static ExpenseBuildResult build(common::ExpenseId id,
                           common::ParticipantId payer,
                           common::Amount amount,
                           std::string split_type,
                           const split::SplitPolicy& policy,
                           std::span<const common::ParticipantId> participants,
                           const std::optional<common::ShareMap>& custom_shares,
                           std::string description);

  // Moves every non-payer share into participant balances. The payer's own
  // share is computed but has no balance effect. Requires the payer and every
  // split key to be in the roster; build() checks membership against the
  // same participant list.
  void apply(accounts::Roster& roster) const;

  [[nodiscard]] const common::ExpenseId& id() const noexcept { return id_; }
  [[nodiscard]] const common::ParticipantId& payer() const noexcept { return payer_; }
  [[nodiscard]] common::Amount amount() const noexcept { return amount_; }
  [[nodiscard]] const common::ShareMap& splits() const noexcept { return splits_; }
  [[nodiscard]] const std::string& split_type() const noexcept { return split_type_; }
  [[nodiscard]] const std::string& description() const noexcept { return description_; }

  [[nodiscard]] common::Amount share_of(const common::ParticipantId& participant) const;
  [[nodiscard]] common::Amount split_total() const;

 private:
  Expense(common::ExpenseId id,
          common::ParticipantId payer,
          common::Amount amount,
          common::ShareMap splits,
          std::string split_type,
          std::string description);

  common::ExpenseId id_;
  common::ParticipantId payer_;
  common::Amount amount_;
  common::ShareMap splits_;
  std::string split_type_;
  std::string description_;
};

struct ExpenseBuildResult {
  common::Status status{common::Status::kOk};
  std::optional<Expense> expense{};
};

}  // namespace ledger
}  // namespace splitcore
