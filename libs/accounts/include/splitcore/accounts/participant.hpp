#pragma once

#include <string>
#include <unordered_map>

#include "splitcore/common/types.hpp"

namespace splitcore {
namespace accounts {

// Net position against each counterparty.
// Positive: this participant is owed by the counterparty.
// Negative: this participant owes the counterparty.
// Zero entries are never stored.
class Participant {
 public:
  Participant(common::ParticipantId id, std::string name);

  [[nodiscard]] const common::ParticipantId& id() const noexcept { return id_; }
  [[nodiscard]] const std::string& name() const noexcept { return name_; }

  [[nodiscard]] common::Amount balance_with(const common::ParticipantId& counterparty) const;
  [[nodiscard]] common::Amount net_balance() const;
  [[nodiscard]] const std::unordered_map<common::ParticipantId, common::Amount>& balances() const noexcept {
    return balances_;
  }

  void adjust(const common::ParticipantId& counterparty, common::Amount delta);

 private:
  common::ParticipantId id_;
  std::string name_;
  std::unordered_map<common::ParticipantId, common::Amount> balances_{};
};

}  // namespace accounts
}  // namespace splitcore
