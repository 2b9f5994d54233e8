#pragma once

#include <cstdint>
#include <string_view>

namespace splitcore {
namespace common {

enum class Status : std::uint8_t {
  kOk,
  kUnknownSplitType,
  kUnknownSettlementPolicy,
  kMissingCustomShares,
  kSplitSumMismatch,
  kPercentageSumMismatch,
  kNoOutstandingBalance,
  kSettlementExceedsBalance,
  kSettlementPolicyUnimplemented,
  kInvalidAmount,
  kUnknownParticipant,
  kInvalidShare,
  kEmptyParticipantSet,
  kDuplicateParticipant,
  kSelfSettlement,
};

// Stable wire-level codes, 3xxx range.
inline constexpr std::uint16_t reject_code(Status status) noexcept {
  if (status == Status::kOk) {
    return 0;
  }
  return static_cast<std::uint16_t>(3000 + static_cast<std::uint16_t>(status));
}

inline constexpr std::string_view to_string(Status status) noexcept {
  switch (status) {
    case Status::kOk:
      return "Ok";
    case Status::kUnknownSplitType:
      return "UnknownSplitType";
    case Status::kUnknownSettlementPolicy:
      return "UnknownSettlementPolicy";
    case Status::kMissingCustomShares:
      return "MissingCustomShares";
    case Status::kSplitSumMismatch:
      return "SplitSumMismatch";
    case Status::kPercentageSumMismatch:
      return "PercentageSumMismatch";
    case Status::kNoOutstandingBalance:
      return "NoOutstandingBalance";
    case Status::kSettlementExceedsBalance:
      return "SettlementExceedsBalance";
    case Status::kSettlementPolicyUnimplemented:
      return "SettlementPolicyUnimplemented";
    case Status::kInvalidAmount:
      return "InvalidAmount";
    case Status::kUnknownParticipant:
      return "UnknownParticipant";
    case Status::kInvalidShare:
      return "InvalidShare";
    case Status::kEmptyParticipantSet:
      return "EmptyParticipantSet";
    case Status::kDuplicateParticipant:
      return "DuplicateParticipant";
    case Status::kSelfSettlement:
      return "SelfSettlement";
  }
  return "Unknown";
}

}  // namespace common
}  // namespace splitcore
