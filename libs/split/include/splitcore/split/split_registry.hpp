#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "splitcore/common/types.hpp"
#include "splitcore/split/split_policy.hpp"

namespace splitcore {
namespace split {

// Key -> split policy. Built once and then read; share a const instance
// across ledgers.
class Registry {
 public:
  // EQUAL, EXACT and PERCENTAGE.
  static Registry with_builtins();

  void register_policy(std::string key, std::shared_ptr<const SplitPolicy> policy);

  [[nodiscard]] const SplitPolicy* find(std::string_view key) const;
  [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }
  [[nodiscard]] std::vector<std::string> keys() const;

 private:
  std::unordered_map<std::string, std::shared_ptr<const SplitPolicy>> policies_{};
};

std::shared_ptr<const Registry> builtin_registry();

}  // namespace split
}  // namespace splitcore
