#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "splitcore/accounts/participant.hpp"
#include "splitcore/common/types.hpp"

namespace splitcore {
namespace accounts {

// Participants in insertion order, indexed by id.
class Roster {
 public:
  enum class AddResult : std::uint8_t {
    kAdded,
    kDuplicate,
  };

  AddResult add(Participant participant);

  [[nodiscard]] Participant* find(const common::ParticipantId& id);
  [[nodiscard]] const Participant* find(const common::ParticipantId& id) const;
  [[nodiscard]] bool contains(const common::ParticipantId& id) const;

  [[nodiscard]] const std::vector<Participant>& participants() const noexcept { return participants_; }
  [[nodiscard]] const std::vector<common::ParticipantId>& ids() const noexcept { return ids_; }
  [[nodiscard]] std::size_t size() const noexcept { return participants_.size(); }
  [[nodiscard]] bool empty() const noexcept { return participants_.empty(); }

  // Sum of every participant's net balance; zero whenever the books balance.
  [[nodiscard]] common::Amount total_net_balance() const;

 private:
  std::vector<Participant> participants_{};
  std::vector<common::ParticipantId> ids_{};
  std::unordered_map<common::ParticipantId, std::size_t> index_{};
};

}  // namespace accounts
}  // namespace splitcore
