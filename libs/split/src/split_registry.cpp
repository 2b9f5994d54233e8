#include "splitcore/split/split_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace splitcore {
namespace split {

Registry Registry::with_builtins() {
  Registry registry;
  registry.register_policy(std::string{common::to_string(common::SplitType::kEqual)},
                           std::make_shared<EqualSplit>());
  registry.register_policy(std::string{common::to_string(common::SplitType::kExact)},
                           std::make_shared<ExactSplit>());
  registry.register_policy(std::string{common::to_string(common::SplitType::kPercentage)},
                           std::make_shared<PercentageSplit>());
  return registry;
}

void Registry::register_policy(std::string key, std::shared_ptr<const SplitPolicy> policy) {
  if (key.empty()) {
    throw std::invalid_argument("split policy key must not be empty");
  }
  if (!policy) {
    throw std::invalid_argument("split policy must not be null: " + key);
  }
  policies_[std::move(key)] = std::move(policy);
}

const SplitPolicy* Registry::find(std::string_view key) const {
  auto it = policies_.find(std::string{key});
  if (it == policies_.end()) {
    return nullptr;
  }
  return it->second.get();
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

}  // namespace split
}  // namespace splitcore
