#include "splitcore/ledger/expense.hpp"

#include <algorithm>
#include <utility>

namespace splitcore {
namespace ledger {

Expense::Expense(common::ExpenseId id,
                 common::ParticipantId payer,
                 common::Amount amount,
                 common::ShareMap splits,
                 std::string split_type,
                 std::string description)
    : id_(std::move(id)),
      payer_(std::move(payer)),
      amount_(amount),
      splits_(std::move(splits)),
      split_type_(std::move(split_type)),
      description_(std::move(description)) {}

ExpenseBuildResult Expense::build(common::ExpenseId id,
                                  common::ParticipantId payer,
                                  common::Amount amount,
                                  std::string split_type,
                                  const split::SplitPolicy& policy,
                                  std::span<const common::ParticipantId> participants,
                                  const std::optional<common::ShareMap>& custom_shares,
                                  std::string description) {
  ExpenseBuildResult result;

  auto split_result = policy.split(split::SplitRequest{
      .payer = payer,
      .amount = amount,
      .participants = participants,
      .custom_shares = custom_shares ? &*custom_shares : nullptr,
  });
  if (split_result.status != common::Status::kOk) {
    result.status = split_result.status;
    return result;
  }

  common::Amount total = 0;
  for (const auto& [participant, share] : split_result.shares) {
    if (std::find(participants.begin(), participants.end(), participant) == participants.end()) {
      result.status = common::Status::kUnknownParticipant;
      return result;
    }
    if (share < 0) {
      result.status = common::Status::kInvalidShare;
      return result;
    }
    if (share > amount) {
      result.status = common::Status::kSplitSumMismatch;
      return result;
    }
    total += share;
  }
  if (total != amount) {
    result.status = common::Status::kSplitSumMismatch;
    return result;
  }

  result.expense = Expense(std::move(id), std::move(payer), amount, std::move(split_result.shares),
                           std::move(split_type), std::move(description));
  return result;
}

void Expense::apply(accounts::Roster& roster) const {
  auto& payer = *roster.find(payer_);
  for (const auto& [participant_id, share] : splits_) {
    if (participant_id == payer_) {
      continue;
    }
    roster.find(participant_id)->adjust(payer_, -share);
    payer.adjust(participant_id, share);
  }
}

common::Amount Expense::share_of(const common::ParticipantId& participant) const {
  if (auto it = splits_.find(participant); it != splits_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount Expense::split_total() const {
  common::Amount total = 0;
  for (const auto& [participant, share] : splits_) {
    total += share;
  }
  return total;
}

}  // namespace ledger
}  // namespace splitcore
