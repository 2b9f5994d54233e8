#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "splitcore/common/types.hpp"

namespace splitcore {
namespace config {

struct LedgerSection {
  std::string name{"Shared Ledger"};
  std::string settlement_policy{"direct_pairwise"};
  unsigned minor_units{2};
};

struct ParticipantConfig {
  std::string name;
};

struct ShareConfig {
  std::string participant;               // participant name
  std::optional<std::int64_t> value;     // minor units (EXACT) or basis points (PERCENTAGE)
};

struct ExpenseConfig {
  std::string payer;
  std::optional<common::Amount> amount;  // nullopt when the text did not parse
  std::string split{"EQUAL"};
  std::string description;
  std::vector<ShareConfig> shares;
};

struct SettlementConfig {
  std::string payer;
  std::string payee;
  std::optional<common::Amount> amount;
};

struct ScenarioConfig {
  LedgerSection ledger;
  std::vector<ParticipantConfig> participants;
  std::vector<ExpenseConfig> expenses;
  std::vector<SettlementConfig> settlements;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  ScenarioConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const ScenarioConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace splitcore
