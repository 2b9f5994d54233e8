#include "splitcore/settlement/settlement_policy.hpp"

namespace splitcore {
namespace settlement {

SettlementResult DirectPairwiseSettlement::settle(accounts::Participant& payer,
                                                  accounts::Participant& payee,
                                                  common::Amount amount,
                                                  accounts::BalanceSheet& sheet) const {
  SettlementResult result;

  const auto outstanding = sheet.find(payer.id(), payee.id());
  if (!outstanding) {
    result.status = common::Status::kNoOutstandingBalance;
    return result;
  }
  if (amount > *outstanding) {
    result.status = common::Status::kSettlementExceedsBalance;
    result.remaining = *outstanding;
    return result;
  }

  result.remaining = sheet.reduce(payer.id(), payee.id(), amount).value_or(0);
  payee.adjust(payer.id(), -amount);
  payer.adjust(payee.id(), amount);
  return result;
}

SettlementResult GraphMinimizingSettlement::settle(accounts::Participant& payer,
                                                   accounts::Participant& payee,
                                                   common::Amount /*amount*/,
                                                   accounts::BalanceSheet& sheet) const {
  return SettlementResult{
      .status = common::Status::kSettlementPolicyUnimplemented,
      .remaining = sheet.outstanding(payer.id(), payee.id()),
  };
}

}  // namespace settlement
}  // namespace splitcore
