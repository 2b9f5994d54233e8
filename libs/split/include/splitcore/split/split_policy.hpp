#pragma once

#include <optional>
#include <span>

#include "splitcore/common/status.hpp"
#include "splitcore/common/types.hpp"

namespace splitcore {
namespace split {

struct SplitRequest {
  common::ParticipantId payer{};
  common::Amount amount{0};
  std::span<const common::ParticipantId> participants{};  // roster order
  const common::ShareMap* custom_shares{nullptr};
};

struct SplitResult {
  common::Status status{common::Status::kOk};
  common::ShareMap shares{};
};

class SplitPolicy {
 public:
  virtual ~SplitPolicy() = default;

  // Pure: turns a request into per-participant shares summing to the amount.
  [[nodiscard]] virtual SplitResult split(const SplitRequest& request) const = 0;
};

// amount / n each, payer included; the remainder goes one minor unit at a
// time to the leading participants.
class EqualSplit final : public SplitPolicy {
 public:
  [[nodiscard]] SplitResult split(const SplitRequest& request) const override;
};

// custom_shares holds explicit amounts that must sum to the expense amount.
class ExactSplit final : public SplitPolicy {
 public:
  [[nodiscard]] SplitResult split(const SplitRequest& request) const override;
};

// custom_shares holds basis points that must sum to 10'000. Shares round
// down; leftover minor units go to participants with a nonzero percentage in
// roster order.
class PercentageSplit final : public SplitPolicy {
 public:
  [[nodiscard]] SplitResult split(const SplitRequest& request) const override;
};

}  // namespace split
}  // namespace splitcore
