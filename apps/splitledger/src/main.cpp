#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "splitcore/accounts/participant.hpp"
#include "splitcore/common/money.hpp"
#include "splitcore/common/status.hpp"
#include "splitcore/config/config_loader.hpp"
#include "splitcore/ledger/ledger.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [scenario_file]\n"
            << "  scenario_file: Path to TOML ledger scenario\n"
            << "                 If not specified, uses ./splitledger.toml or the built-in demo\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  std::filesystem::path default_paths[] = {
      "./splitledger.toml",
      std::filesystem::path{getenv("HOME") ? getenv("HOME") : ""} / ".config/splitledger/splitledger.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

void print_passbook(const splitcore::common::Passbook& passbook,
                    const std::unordered_map<std::string, std::string>& names,
                    unsigned minor_units) {
  if (passbook.empty()) {
    std::cout << "  (all settled)\n";
    return;
  }
  for (const auto& [debtor, creditors] : passbook) {
    for (const auto& [creditor, amount] : creditors) {
      std::cout << "  " << names.at(debtor) << " owes " << names.at(creditor) << " "
                << splitcore::common::format_amount(amount, minor_units) << "\n";
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace splitcore;

  if (argc > 2) {
    print_usage(argv[0]);
    return 1;
  }

  auto config_path = find_config_path(argc, argv);
  config::ScenarioConfig cfg;

  if (config_path.empty()) {
    std::cout << "No scenario file found, using built-in demo\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default scenario: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading scenario from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  const unsigned minor_units = cfg.ledger.minor_units;

  std::vector<accounts::Participant> members;
  std::unordered_map<std::string, std::string> id_by_name;
  std::unordered_map<std::string, std::string> name_by_id;
  for (const auto& participant_cfg : cfg.participants) {
    auto participant = ledger::create_participant(participant_cfg.name);
    id_by_name.emplace(participant.name(), participant.id());
    name_by_id.emplace(participant.id(), participant.name());
    members.push_back(std::move(participant));
  }

  auto created = ledger::create_ledger(cfg.ledger.name, members, cfg.ledger.settlement_policy);
  if (created.status != common::Status::kOk) {
    std::cerr << "Failed to create ledger: " << common::to_string(created.status)
              << " (" << created.reject_code << ")\n";
    return 1;
  }
  auto& group = *created.ledger;

  std::cout << "Ledger " << group.name() << " (" << group.id() << ")\n";
  std::cout << "  Participants: " << members.size() << "\n";
  std::cout << "  Settlement policy: " << group.settlement_policy() << "\n";

  for (const auto& expense_cfg : cfg.expenses) {
    ledger::ExpenseRequest request{
        .payer = id_by_name.at(expense_cfg.payer),
        .amount = *expense_cfg.amount,
        .split_type = expense_cfg.split,
        .custom_shares = std::nullopt,
        .description = expense_cfg.description,
    };
    if (!expense_cfg.shares.empty()) {
      common::ShareMap shares;
      for (const auto& share : expense_cfg.shares) {
        shares[id_by_name.at(share.participant)] = *share.value;
      }
      request.custom_shares = std::move(shares);
    }

    const auto result = group.add_expense(request);
    if (result.status != common::Status::kOk) {
      std::cout << "Rejected expense '" << expense_cfg.description << "': "
                << common::to_string(result.status) << " (" << result.reject_code << ")\n";
      continue;
    }
    std::cout << "Added expense '" << expense_cfg.description << "': " << expense_cfg.payer << " paid "
              << common::format_amount(request.amount, minor_units) << " (" << expense_cfg.split << ")\n";
  }

  std::cout << "Passbook:\n";
  print_passbook(group.get_passbook(), name_by_id, minor_units);

  for (const auto& settlement_cfg : cfg.settlements) {
    const auto result = group.settle(id_by_name.at(settlement_cfg.payer),
                                     id_by_name.at(settlement_cfg.payee),
                                     *settlement_cfg.amount);
    if (result.status != common::Status::kOk) {
      std::cout << "Rejected settlement " << settlement_cfg.payer << " -> " << settlement_cfg.payee << ": "
                << common::to_string(result.status) << " (" << result.reject_code << ")\n";
      continue;
    }
    std::cout << "Settled " << settlement_cfg.payer << " -> " << settlement_cfg.payee << " "
              << common::format_amount(*settlement_cfg.amount, minor_units) << ", remaining "
              << common::format_amount(result.remaining, minor_units) << "\n";
  }

  std::cout << "Updated passbook:\n";
  print_passbook(group.get_passbook(), name_by_id, minor_units);

  std::cout << "Net balances:\n";
  for (const auto& participant : group.participants()) {
    std::cout << "  " << participant.name() << ": "
              << common::format_amount(participant.net_balance(), minor_units) << "\n";
  }

  if (group.total_net_balance() != 0) {
    std::cerr << "Ledger out of balance by "
              << common::format_amount(group.total_net_balance(), minor_units) << "\n";
    return 1;
  }
  return 0;
}
