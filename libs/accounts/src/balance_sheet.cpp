#include "splitcore/accounts/balance_sheet.hpp"

namespace splitcore {
namespace accounts {

std::optional<common::Amount> BalanceSheet::find(const common::ParticipantId& debtor,
                                                 const common::ParticipantId& creditor) const {
  auto debtor_it = entries_.find(debtor);
  if (debtor_it == entries_.end()) {
    return std::nullopt;
  }
  auto creditor_it = debtor_it->second.find(creditor);
  if (creditor_it == debtor_it->second.end()) {
    return std::nullopt;
  }
  return creditor_it->second;
}

common::Amount BalanceSheet::outstanding(const common::ParticipantId& debtor,
                                         const common::ParticipantId& creditor) const {
  return find(debtor, creditor).value_or(0);
}

void BalanceSheet::accrue(const common::ParticipantId& debtor,
                          const common::ParticipantId& creditor,
                          common::Amount amount) {
  if (amount <= 0) {
    return;
  }
  entries_[debtor][creditor] += amount;
}

std::optional<common::Amount> BalanceSheet::reduce(const common::ParticipantId& debtor,
                                                   const common::ParticipantId& creditor,
                                                   common::Amount amount) {
  auto debtor_it = entries_.find(debtor);
  if (debtor_it == entries_.end()) {
    return std::nullopt;
  }
  auto creditor_it = debtor_it->second.find(creditor);
  if (creditor_it == debtor_it->second.end() || amount > creditor_it->second) {
    return std::nullopt;
  }

  const common::Amount remaining = creditor_it->second - amount;
  if (remaining == 0) {
    debtor_it->second.erase(creditor_it);
    if (debtor_it->second.empty()) {
      entries_.erase(debtor_it);
    }
  } else {
    creditor_it->second = remaining;
  }
  return remaining;
}

std::size_t BalanceSheet::pair_count() const noexcept {
  std::size_t count = 0;
  for (const auto& [debtor, creditors] : entries_) {
    count += creditors.size();
  }
  return count;
}

}  // namespace accounts
}  // namespace splitcore
