#include "splitcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>

#include "splitcore/common/money.hpp"
#include "splitcore/settlement/settlement_registry.hpp"
#include "splitcore/split/split_registry.hpp"

namespace splitcore {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

// Integers are whole currency units, strings are exact decimals. Floats are
// rejected.
std::optional<common::Amount> node_to_amount(const toml::node* node, unsigned minor_units) {
  if (!node) {
    return std::nullopt;
  }
  if (const auto* integer = node->as_integer()) {
    const std::int64_t whole = integer->get();
    const std::int64_t scale = common::minor_scale(minor_units);
    if (whole > common::kMaxAmount / scale || whole < -common::kMaxAmount / scale) {
      return std::nullopt;
    }
    return whole * scale;
  }
  if (const auto* text = node->as_string()) {
    return common::parse_amount(text->get(), minor_units);
  }
  return std::nullopt;
}

// Percent as integer, float or decimal string; 12.5 -> 1250 bp.
std::optional<common::BasisPoints> node_to_basis_points(const toml::node* node) {
  if (!node) {
    return std::nullopt;
  }
  if (const auto* integer = node->as_integer()) {
    const std::int64_t percent = integer->get();
    if (percent > common::kBasisPointDenominator || percent < -common::kBasisPointDenominator) {
      return std::nullopt;
    }
    return percent * 100;
  }
  if (const auto* floating = node->as_floating_point()) {
    const double percent = floating->get();
    if (!std::isfinite(percent) || std::fabs(percent) > static_cast<double>(common::kBasisPointDenominator)) {
      return std::nullopt;
    }
    // Same precision as the string form: at most two decimal places.
    const double scaled = percent * 100.0;
    const double rounded = std::round(scaled);
    if (std::fabs(scaled - rounded) > 1e-6) {
      return std::nullopt;
    }
    return static_cast<common::BasisPoints>(rounded);
  }
  if (const auto* text = node->as_string()) {
    return common::parse_amount(text->get(), 2);
  }
  return std::nullopt;
}

LedgerSection parse_ledger(const toml::table& root) {
  LedgerSection cfg;
  if (auto* ledger = root["ledger"].as_table()) {
    cfg.name = get_str_or(*ledger, "name", cfg.name);
    cfg.settlement_policy = get_str_or(*ledger, "settlement_policy", cfg.settlement_policy);
    cfg.minor_units = static_cast<unsigned>(get_int_or(*ledger, "minor_units", cfg.minor_units));
  }
  return cfg;
}

std::vector<ParticipantConfig> parse_participants(const toml::table& root) {
  std::vector<ParticipantConfig> participants;
  if (auto* arr = root["participants"].as_array()) {
    for (const auto& elem : *arr) {
      if (auto* participant_tbl = elem.as_table()) {
        participants.push_back(ParticipantConfig{get_str_or(*participant_tbl, "name", "")});
      }
    }
  }
  return participants;
}

std::vector<ExpenseConfig> parse_expenses(const toml::table& root, unsigned minor_units) {
  std::vector<ExpenseConfig> expenses;
  if (auto* arr = root["expenses"].as_array()) {
    for (const auto& elem : *arr) {
      auto* expense_tbl = elem.as_table();
      if (!expense_tbl) {
        continue;
      }

      ExpenseConfig expense;
      expense.payer = get_str_or(*expense_tbl, "payer", "");
      expense.amount = node_to_amount(expense_tbl->get("amount"), minor_units);
      expense.split = get_str_or(*expense_tbl, "split", expense.split);
      expense.description = get_str_or(*expense_tbl, "description", "");

      const bool percentage =
          expense.split == common::to_string(common::SplitType::kPercentage);
      if (auto* shares_tbl = (*expense_tbl)["shares"].as_table()) {
        for (auto&& [key, node] : *shares_tbl) {
          ShareConfig share;
          share.participant = std::string(key.str());
          share.value = percentage ? node_to_basis_points(&node) : node_to_amount(&node, minor_units);
          expense.shares.push_back(std::move(share));
        }
      }

      expenses.push_back(std::move(expense));
    }
  }
  return expenses;
}

std::vector<SettlementConfig> parse_settlements(const toml::table& root, unsigned minor_units) {
  std::vector<SettlementConfig> settlements;
  if (auto* arr = root["settlements"].as_array()) {
    for (const auto& elem : *arr) {
      if (auto* settlement_tbl = elem.as_table()) {
        SettlementConfig settlement;
        settlement.payer = get_str_or(*settlement_tbl, "payer", "");
        settlement.payee = get_str_or(*settlement_tbl, "payee", "");
        settlement.amount = node_to_amount(settlement_tbl->get("amount"), minor_units);
        settlements.push_back(std::move(settlement));
      }
    }
  }
  return settlements;
}

ScenarioConfig parse_config(const toml::table& root) {
  ScenarioConfig cfg;
  cfg.ledger = parse_ledger(root);
  const unsigned minor_units = std::min(cfg.ledger.minor_units, common::kMaxMinorUnits);
  cfg.participants = parse_participants(root);
  cfg.expenses = parse_expenses(root, minor_units);
  cfg.settlements = parse_settlements(root, minor_units);
  return cfg;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const ScenarioConfig& config) {
  std::vector<ValidationError> errors;

  if (config.ledger.name.empty()) {
    errors.push_back({"ledger.name", "name cannot be empty"});
  }

  if (!settlement::builtin_registry()->contains(config.ledger.settlement_policy)) {
    errors.push_back({"ledger.settlement_policy", "unknown settlement policy: " + config.ledger.settlement_policy});
  }

  if (config.ledger.minor_units > common::kMaxMinorUnits) {
    errors.push_back({"ledger.minor_units", "must be between 0 and 6"});
  }

  if (config.participants.empty()) {
    errors.push_back({"participants", "at least one participant is required"});
  }

  std::unordered_set<std::string> names;
  for (std::size_t i = 0; i < config.participants.size(); ++i) {
    const auto& participant = config.participants[i];
    std::string prefix = "participants[" + std::to_string(i) + "]";

    if (participant.name.empty()) {
      errors.push_back({prefix + ".name", "name cannot be empty"});
    } else if (!names.insert(participant.name).second) {
      errors.push_back({prefix + ".name", "duplicate participant: " + participant.name});
    }
  }

  for (std::size_t i = 0; i < config.expenses.size(); ++i) {
    const auto& expense = config.expenses[i];
    std::string prefix = "expenses[" + std::to_string(i) + "]";

    if (names.find(expense.payer) == names.end()) {
      errors.push_back({prefix + ".payer", "unknown participant: " + expense.payer});
    }

    if (!expense.amount) {
      errors.push_back({prefix + ".amount", "must be an integer or a decimal string"});
    }

    if (!split::builtin_registry()->contains(expense.split)) {
      errors.push_back({prefix + ".split", "unknown split type: " + expense.split});
    }

    for (const auto& share : expense.shares) {
      if (names.find(share.participant) == names.end()) {
        errors.push_back({prefix + ".shares." + share.participant, "unknown participant"});
      }
      if (!share.value) {
        errors.push_back({prefix + ".shares." + share.participant, "unparseable share value"});
      }
    }
  }

  for (std::size_t i = 0; i < config.settlements.size(); ++i) {
    const auto& settlement = config.settlements[i];
    std::string prefix = "settlements[" + std::to_string(i) + "]";

    if (names.find(settlement.payer) == names.end()) {
      errors.push_back({prefix + ".payer", "unknown participant: " + settlement.payer});
    }

    if (names.find(settlement.payee) == names.end()) {
      errors.push_back({prefix + ".payee", "unknown participant: " + settlement.payee});
    }

    if (!settlement.amount) {
      errors.push_back({prefix + ".amount", "must be an integer or a decimal string"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# splitledger scenario
# Generated default: a three-person trip

[ledger]
name = "Goa Trip"
settlement_policy = "direct_pairwise"
minor_units = 2

[[participants]]
name = "Alice"

[[participants]]
name = "Bob"

[[participants]]
name = "Charlie"

[[expenses]]
payer = "Alice"
amount = "300.00"
split = "EQUAL"
description = "Hotel"

[[expenses]]
payer = "Bob"
amount = "400.00"
split = "EXACT"
description = "Scuba diving"

[expenses.shares]
Alice = "100.00"
Bob = "200.00"
Charlie = "100.00"

[[expenses]]
payer = "Charlie"
amount = "500.00"
split = "PERCENTAGE"
description = "Dinner"

[expenses.shares]
Alice = 40
Bob = 40
Charlie = 20

[[settlements]]
payer = "Bob"
payee = "Alice"
amount = "100.00"
)";
}

}  // namespace config
}  // namespace splitcore
