#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace splitcore {
namespace common {

using ParticipantId = std::string;
using ExpenseId = std::string;
using LedgerId = std::string;

// Currency amounts are integer minor units (cents for a 2-digit currency).
using Amount = std::int64_t;
using BasisPoints = std::int64_t;

inline constexpr BasisPoints kBasisPointDenominator = 10'000;  // 100%
inline constexpr Amount kMaxAmount = 1'000'000'000'000;        // keeps amount * bp within int64

// Participant id -> amount (Exact) or basis points (Percentage).
using ShareMap = std::map<ParticipantId, std::int64_t>;

// Debtor id -> creditor id -> outstanding amount.
using Passbook = std::map<ParticipantId, std::map<ParticipantId, Amount>>;

enum class SplitType : std::uint8_t {
  kEqual,
  kExact,
  kPercentage,
};

enum class SettlementAlgo : std::uint8_t {
  kDirectPairwise,
  kGraphMinimizing,
};

inline constexpr std::string_view to_string(SplitType type) noexcept {
  switch (type) {
    case SplitType::kEqual:
      return "EQUAL";
    case SplitType::kExact:
      return "EXACT";
    case SplitType::kPercentage:
      return "PERCENTAGE";
  }
  return "";
}

inline constexpr std::string_view to_string(SettlementAlgo algo) noexcept {
  switch (algo) {
    case SettlementAlgo::kDirectPairwise:
      return "direct_pairwise";
    case SettlementAlgo::kGraphMinimizing:
      return "graph_minimizing";
  }
  return "";
}

[[nodiscard]] inline constexpr bool is_valid_amount(Amount amount) noexcept {
  return amount > 0 && amount <= kMaxAmount;
}

}  // namespace common
}  // namespace splitcore
