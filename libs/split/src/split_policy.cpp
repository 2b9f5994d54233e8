#include "splitcore/split/split_policy.hpp"

#include <algorithm>
#include <cstdint>

namespace splitcore {
namespace split {

namespace {

bool has_custom_shares(const SplitRequest& request) {
  return request.custom_shares != nullptr && !request.custom_shares->empty();
}

bool is_member(const SplitRequest& request, const common::ParticipantId& id) {
  return std::find(request.participants.begin(), request.participants.end(), id) != request.participants.end();
}

// Shared checks for custom share maps: every key a member, every value in
// [0, max_value]. Bounding each value keeps the later sums inside int64.
common::Status validate_custom_shares(const SplitRequest& request,
                                      std::int64_t max_value,
                                      common::Status over_limit) {
  if (!has_custom_shares(request)) {
    return common::Status::kMissingCustomShares;
  }
  for (const auto& [participant, value] : *request.custom_shares) {
    if (!is_member(request, participant)) {
      return common::Status::kUnknownParticipant;
    }
    if (value < 0) {
      return common::Status::kInvalidShare;
    }
    if (value > max_value) {
      return over_limit;
    }
  }
  return common::Status::kOk;
}

}  // namespace

SplitResult EqualSplit::split(const SplitRequest& request) const {
  SplitResult result;
  if (request.participants.empty()) {
    result.status = common::Status::kEmptyParticipantSet;
    return result;
  }

  const auto count = static_cast<common::Amount>(request.participants.size());
  const common::Amount per_head = request.amount / count;
  common::Amount remainder = request.amount % count;

  for (const auto& participant : request.participants) {
    common::Amount share = per_head;
    if (remainder > 0) {
      ++share;
      --remainder;
    }
    result.shares[participant] = share;
  }
  return result;
}

SplitResult ExactSplit::split(const SplitRequest& request) const {
  SplitResult result;
  result.status = validate_custom_shares(request, request.amount, common::Status::kSplitSumMismatch);
  if (result.status != common::Status::kOk) {
    return result;
  }

  common::Amount total = 0;
  for (const auto& [participant, share] : *request.custom_shares) {
    total += share;
  }
  if (total != request.amount) {
    result.status = common::Status::kSplitSumMismatch;
    return result;
  }

  result.shares = *request.custom_shares;
  return result;
}

SplitResult PercentageSplit::split(const SplitRequest& request) const {
  SplitResult result;
  result.status = validate_custom_shares(request, common::kBasisPointDenominator,
                                         common::Status::kPercentageSumMismatch);
  if (result.status != common::Status::kOk) {
    return result;
  }
  if (!common::is_valid_amount(request.amount)) {
    result.status = common::Status::kInvalidAmount;
    return result;
  }

  common::BasisPoints total_bp = 0;
  for (const auto& [participant, bp] : *request.custom_shares) {
    total_bp += bp;
  }
  if (total_bp != common::kBasisPointDenominator) {
    result.status = common::Status::kPercentageSumMismatch;
    return result;
  }

  common::Amount allocated = 0;
  for (const auto& [participant, bp] : *request.custom_shares) {
    const common::Amount share = (request.amount * bp) / common::kBasisPointDenominator;
    result.shares[participant] = share;
    allocated += share;
  }

  // Each floor loses less than one unit, so one pass over the nonzero
  // holders always absorbs the leftover.
  common::Amount leftover = request.amount - allocated;
  for (const auto& participant : request.participants) {
    if (leftover == 0) {
      break;
    }
    auto it = request.custom_shares->find(participant);
    if (it == request.custom_shares->end() || it->second == 0) {
      continue;
    }
    ++result.shares[participant];
    --leftover;
  }
  return result;
}

}  // namespace split
}  // namespace splitcore
