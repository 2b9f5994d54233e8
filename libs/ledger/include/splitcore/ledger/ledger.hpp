#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "splitcore/accounts/balance_sheet.hpp"
#include "splitcore/accounts/participant.hpp"
#include "splitcore/accounts/roster.hpp"
#include "splitcore/common/status.hpp"
#include "splitcore/common/types.hpp"
#include "splitcore/ledger/expense.hpp"
#include "splitcore/settlement/settlement_registry.hpp"
#include "splitcore/split/split_registry.hpp"

namespace splitcore {
namespace ledger {

struct LedgerOptions {
  // Null selects the built-in registry.
  std::shared_ptr<const split::Registry> split_policies{};
  std::shared_ptr<const settlement::Registry> settlement_policies{};
};

struct ExpenseRequest {
  common::ParticipantId payer{};
  common::Amount amount{0};
  std::string split_type{};
  std::optional<common::ShareMap> custom_shares{};
  std::string description{};
};

struct ExpenseResult {
  common::Status status{common::Status::kOk};
  std::uint16_t reject_code{0};
  common::ExpenseId expense_id{};
};

struct SettleResult {
  common::Status status{common::Status::kOk};
  std::uint16_t reject_code{0};
  common::Amount remaining{0};
};

class Ledger;

struct CreateResult {
  common::Status status{common::Status::kOk};
  std::uint16_t reject_code{0};
  std::unique_ptr<Ledger> ledger{};
};

// Group aggregate: owns its participants, the expense history and the
// balance sheet. Every public call runs under the ledger's mutex, so writes
// are single transactions and reads see consistent snapshots.
class Ledger {
  // Restricts construction to create() while still allowing make_unique.
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

 public:
  // Members start with empty balances; the ledger holds its own copies.
  static CreateResult create(std::string name,
                             const std::vector<accounts::Participant>& participants,
                             std::string_view settlement_policy,
                             LedgerOptions options = {});

  Ledger(ConstructionKey,
         common::LedgerId id,
         std::string name,
         accounts::Roster roster,
         std::string settlement_key,
         std::shared_ptr<const settlement::SettlementPolicy> settlement_policy,
         std::shared_ptr<const split::Registry> split_policies);

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;

  [[nodiscard]] ExpenseResult add_expense(const ExpenseRequest& request);
  [[nodiscard]] ExpenseResult add_expense(const common::ParticipantId& payer,
                                          common::Amount amount,
                                          common::SplitType split_type,
                                          std::optional<common::ShareMap> custom_shares = std::nullopt,
                                          std::string description = {});

  [[nodiscard]] SettleResult settle(const common::ParticipantId& payer,
                                    const common::ParticipantId& payee,
                                    common::Amount amount);

  [[nodiscard]] common::Passbook get_passbook() const;
  [[nodiscard]] common::Amount outstanding(const common::ParticipantId& debtor,
                                           const common::ParticipantId& creditor) const;

  [[nodiscard]] std::vector<Expense> expenses() const;
  [[nodiscard]] std::size_t expense_count() const;
  [[nodiscard]] std::vector<accounts::Participant> participants() const;
  [[nodiscard]] std::optional<accounts::Participant> participant(const common::ParticipantId& id) const;
  [[nodiscard]] common::Amount total_net_balance() const;

  [[nodiscard]] const common::LedgerId& id() const noexcept { return id_; }
  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const std::string& settlement_policy() const noexcept { return settlement_key_; }

 private:
  const common::LedgerId id_;
  const std::string name_;
  const std::string settlement_key_;
  const std::shared_ptr<const settlement::SettlementPolicy> settlement_policy_;
  const std::shared_ptr<const split::Registry> split_policies_;

  mutable std::mutex mutex_;
  accounts::Roster roster_;
  accounts::BalanceSheet sheet_{};
  std::vector<Expense> expenses_{};
};

// New participant with a fresh opaque id.
accounts::Participant create_participant(std::string name);

CreateResult create_ledger(std::string name,
                           const std::vector<accounts::Participant>& participants,
                           std::string_view settlement_policy,
                           LedgerOptions options = {});

}  // namespace ledger
}  // namespace splitcore
