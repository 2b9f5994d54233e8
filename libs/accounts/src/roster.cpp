#include "splitcore/accounts/roster.hpp"

#include <utility>

namespace splitcore {
namespace accounts {

Roster::AddResult Roster::add(Participant participant) {
  auto [it, inserted] = index_.try_emplace(participant.id(), participants_.size());
  if (!inserted) {
    return AddResult::kDuplicate;
  }
  ids_.push_back(participant.id());
  participants_.push_back(std::move(participant));
  return AddResult::kAdded;
}

Participant* Roster::find(const common::ParticipantId& id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &participants_[it->second];
}

const Participant* Roster::find(const common::ParticipantId& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &participants_[it->second];
}

bool Roster::contains(const common::ParticipantId& id) const {
  return index_.find(id) != index_.end();
}

common::Amount Roster::total_net_balance() const {
  common::Amount total = 0;
  for (const auto& participant : participants_) {
    total += participant.net_balance();
  }
  return total;
}

}  // namespace accounts
}  // namespace splitcore
