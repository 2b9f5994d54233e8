#include "splitcore/accounts/participant.hpp"

#include <utility>

namespace splitcore {
namespace accounts {

Participant::Participant(common::ParticipantId id, std::string name)
    : id_(std::move(id)), name_(std::move(name)) {}

common::Amount Participant::balance_with(const common::ParticipantId& counterparty) const {
  if (auto it = balances_.find(counterparty); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount Participant::net_balance() const {
  common::Amount total = 0;
  for (const auto& [counterparty, amount] : balances_) {
    total += amount;
  }
  return total;
}

void Participant::adjust(const common::ParticipantId& counterparty, common::Amount delta) {
  if (delta == 0) {
    return;
  }
  auto [it, inserted] = balances_.try_emplace(counterparty, 0);
  it->second += delta;
  if (it->second == 0) {
    balances_.erase(it);
  }
}

}  // namespace accounts
}  // namespace splitcore
