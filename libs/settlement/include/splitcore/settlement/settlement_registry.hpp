#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "splitcore/common/types.hpp"
#include "splitcore/settlement/settlement_policy.hpp"

namespace splitcore {
namespace settlement {

class Registry {
 public:
  // direct_pairwise and graph_minimizing.
  static Registry with_builtins();

  void register_policy(std::string key, std::shared_ptr<const SettlementPolicy> policy);

  // Shared handle so a ledger can keep its policy alive past the registry.
  [[nodiscard]] std::shared_ptr<const SettlementPolicy> find(std::string_view key) const;
  [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }
  [[nodiscard]] std::vector<std::string> keys() const;

 private:
  std::unordered_map<std::string, std::shared_ptr<const SettlementPolicy>> policies_{};
};

std::shared_ptr<const Registry> builtin_registry();

}  // namespace settlement
}  // namespace splitcore
