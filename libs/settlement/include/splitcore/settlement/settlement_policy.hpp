#pragma once

#include "splitcore/accounts/balance_sheet.hpp"
#include "splitcore/accounts/participant.hpp"
#include "splitcore/common/status.hpp"
#include "splitcore/common/types.hpp"

namespace splitcore {
namespace settlement {

struct SettlementResult {
  common::Status status{common::Status::kOk};
  common::Amount remaining{0};  // outstanding payer -> payee debt afterwards
};

class SettlementPolicy {
 public:
  virtual ~SettlementPolicy() = default;

  // Repays amount of payer's debt to payee. Implementations validate before
  // mutating; a rejected call leaves sheet and both participants untouched.
  [[nodiscard]] virtual SettlementResult settle(accounts::Participant& payer,
                                                accounts::Participant& payee,
                                                common::Amount amount,
                                                accounts::BalanceSheet& sheet) const = 0;
};

// Reduces sheet[payer][payee] only; the reverse pair is never netted.
class DirectPairwiseSettlement final : public SettlementPolicy {
 public:
  [[nodiscard]] SettlementResult settle(accounts::Participant& payer,
                                        accounts::Participant& payee,
                                        common::Amount amount,
                                        accounts::BalanceSheet& sheet) const override;
};

// Group-wide transfer minimisation. Selectable, but has no algorithm yet:
// every call is rejected with kSettlementPolicyUnimplemented.
class GraphMinimizingSettlement final : public SettlementPolicy {
 public:
  [[nodiscard]] SettlementResult settle(accounts::Participant& payer,
                                        accounts::Participant& payee,
                                        common::Amount amount,
                                        accounts::BalanceSheet& sheet) const override;
};

}  // namespace settlement
}  // namespace splitcore
