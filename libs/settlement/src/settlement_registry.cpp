#include "splitcore/settlement/settlement_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace splitcore {
namespace settlement {

Registry Registry::with_builtins() {
  Registry registry;
  registry.register_policy(std::string{common::to_string(common::SettlementAlgo::kDirectPairwise)},
                           std::make_shared<DirectPairwiseSettlement>());
  registry.register_policy(std::string{common::to_string(common::SettlementAlgo::kGraphMinimizing)},
                           std::make_shared<GraphMinimizingSettlement>());
  return registry;
}

void Registry::register_policy(std::string key, std::shared_ptr<const SettlementPolicy> policy) {
  if (key.empty()) {
    throw std::invalid_argument("settlement policy key must not be empty");
  }
  if (!policy) {
    throw std::invalid_argument("settlement policy must not be null: " + key);
  }
  policies_[std::move(key)] = std::move(policy);
}

std::shared_ptr<const SettlementPolicy> Registry::find(std::string_view key) const {
  auto it = policies_.find(std::string{key});
  if (it == policies_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::string> Registry::keys() const {
  std::vector<std::string> out;
  out.reserve(policies_.size());
  for (const auto& [key, policy] : policies_) {
    out.push_back(key);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::shared_ptr<const Registry> builtin_registry() {
  static const std::shared_ptr<const Registry> registry =
      std::make_shared<const Registry>(Registry::with_builtins());
  return registry;
}

}  // namespace settlement
}  // namespace splitcore
