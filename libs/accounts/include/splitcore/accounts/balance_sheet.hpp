#pragma once

#include <map>
#include <optional>

#include "splitcore/common/types.hpp"

namespace splitcore {
namespace accounts {

// Outstanding debt per ordered (debtor, creditor) pair. Every stored entry is
// strictly positive; lookups never insert.
class BalanceSheet {
 public:
  // Entry for the pair, if one is recorded.
  [[nodiscard]] std::optional<common::Amount> find(const common::ParticipantId& debtor,
                                                   const common::ParticipantId& creditor) const;

  // Recorded amount, or zero when absent.
  [[nodiscard]] common::Amount outstanding(const common::ParticipantId& debtor,
                                           const common::ParticipantId& creditor) const;

  // Adds a positive amount to the pair; non-positive amounts are ignored.
  void accrue(const common::ParticipantId& debtor, const common::ParticipantId& creditor, common::Amount amount);

  // Lowers the pair by amount, erasing it at zero. Returns the remaining
  // balance, or nullopt if the pair has no entry or amount exceeds it.
  std::optional<common::Amount> reduce(const common::ParticipantId& debtor,
                                       const common::ParticipantId& creditor,
                                       common::Amount amount);

  [[nodiscard]] common::Passbook snapshot() const { return entries_; }
  [[nodiscard]] std::size_t pair_count() const noexcept;
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

 private:
  common::Passbook entries_{};
};

}  // namespace accounts
}  // namespace splitcore
