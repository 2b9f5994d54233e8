#include "splitcore/ledger/ledger.hpp"

#include <memory>
#include <utility>

#include "splitcore/identity/id_generator.hpp"

namespace splitcore {
namespace ledger {

namespace {

ExpenseResult reject_expense(common::Status status) {
  return ExpenseResult{.status = status, .reject_code = common::reject_code(status)};
}

SettleResult reject_settle(common::Status status, common::Amount remaining = 0) {
  return SettleResult{.status = status, .reject_code = common::reject_code(status), .remaining = remaining};
}

CreateResult reject_create(common::Status status) {
  return CreateResult{.status = status, .reject_code = common::reject_code(status)};
}

}  // namespace

Ledger::Ledger(ConstructionKey,
               common::LedgerId id,
               std::string name,
               accounts::Roster roster,
               std::string settlement_key,
               std::shared_ptr<const settlement::SettlementPolicy> settlement_policy,
               std::shared_ptr<const split::Registry> split_policies)
    : id_(std::move(id)),
      name_(std::move(name)),
      settlement_key_(std::move(settlement_key)),
      settlement_policy_(std::move(settlement_policy)),
      split_policies_(std::move(split_policies)),
      roster_(std::move(roster)) {}

CreateResult Ledger::create(std::string name,
                            const std::vector<accounts::Participant>& participants,
                            std::string_view settlement_policy,
                            LedgerOptions options) {
  auto settlement_policies = options.settlement_policies ? std::move(options.settlement_policies)
                                                         : settlement::builtin_registry();
  auto split_policies = options.split_policies ? std::move(options.split_policies)
                                               : split::builtin_registry();

  auto policy = settlement_policies->find(settlement_policy);
  if (!policy) {
    return reject_create(common::Status::kUnknownSettlementPolicy);
  }
  if (participants.empty()) {
    return reject_create(common::Status::kEmptyParticipantSet);
  }

  accounts::Roster roster;
  for (const auto& participant : participants) {
    if (roster.add(accounts::Participant{participant.id(), participant.name()}) ==
        accounts::Roster::AddResult::kDuplicate) {
      return reject_create(common::Status::kDuplicateParticipant);
    }
  }

  CreateResult result;
  result.ledger = std::make_unique<Ledger>(ConstructionKey{},
                                          identity::default_generator().next(identity::IdKind::kLedger),
                                          std::move(name),
                                          std::move(roster),
                                          std::string{settlement_policy},
                                          std::move(policy),
                                          std::move(split_policies));
  return result;
}

ExpenseResult Ledger::add_expense(const ExpenseRequest& request) {
  std::scoped_lock lock(mutex_);

  const auto* policy = split_policies_->find(request.split_type);
  if (!policy) {
    return reject_expense(common::Status::kUnknownSplitType);
  }
  if (!roster_.contains(request.payer)) {
    return reject_expense(common::Status::kUnknownParticipant);
  }
  if (!common::is_valid_amount(request.amount)) {
    return reject_expense(common::Status::kInvalidAmount);
  }

  auto built = Expense::build(identity::default_generator().next(identity::IdKind::kExpense),
                              request.payer,
                              request.amount,
                              request.split_type,
                              *policy,
                              roster_.ids(),
                              request.custom_shares,
                              request.description);
  if (built.status != common::Status::kOk) {
    return reject_expense(built.status);
  }

  // Nothing below can fail: the expense is applied whole.
  const Expense& expense = *built.expense;
  expense.apply(roster_);
  for (const auto& [participant, share] : expense.splits()) {
    if (participant != expense.payer() && share > 0) {
      sheet_.accrue(participant, expense.payer(), share);
    }
  }

  ExpenseResult result{.expense_id = expense.id()};
  expenses_.push_back(std::move(*built.expense));
  return result;
}

ExpenseResult Ledger::add_expense(const common::ParticipantId& payer,
                                  common::Amount amount,
                                  common::SplitType split_type,
                                  std::optional<common::ShareMap> custom_shares,
                                  std::string description) {
  return add_expense(ExpenseRequest{
      .payer = payer,
      .amount = amount,
      .split_type = std::string{common::to_string(split_type)},
      .custom_shares = std::move(custom_shares),
      .description = std::move(description),
  });
}

SettleResult Ledger::settle(const common::ParticipantId& payer,
                            const common::ParticipantId& payee,
                            common::Amount amount) {
  std::scoped_lock lock(mutex_);

  auto* payer_state = roster_.find(payer);
  auto* payee_state = roster_.find(payee);
  if (!payer_state || !payee_state) {
    return reject_settle(common::Status::kUnknownParticipant);
  }
  if (payer == payee) {
    return reject_settle(common::Status::kSelfSettlement);
  }
  if (!common::is_valid_amount(amount)) {
    return reject_settle(common::Status::kInvalidAmount, sheet_.outstanding(payer, payee));
  }

  const auto outcome = settlement_policy_->settle(*payer_state, *payee_state, amount, sheet_);
  return SettleResult{
      .status = outcome.status,
      .reject_code = common::reject_code(outcome.status),
      .remaining = outcome.remaining,
  };
}

common::Passbook Ledger::get_passbook() const {
  std::scoped_lock lock(mutex_);
  return sheet_.snapshot();
}

common::Amount Ledger::outstanding(const common::ParticipantId& debtor,
                                   const common::ParticipantId& creditor) const {
  std::scoped_lock lock(mutex_);
  return sheet_.outstanding(debtor, creditor);
}

std::vector<Expense> Ledger::expenses() const {
  std::scoped_lock lock(mutex_);
  return expenses_;
}

std::size_t Ledger::expense_count() const {
  std::scoped_lock lock(mutex_);
  return expenses_.size();
}

std::vector<accounts::Participant> Ledger::participants() const {
  std::scoped_lock lock(mutex_);
  return roster_.participants();
}

std::optional<accounts::Participant> Ledger::participant(const common::ParticipantId& id) const {
  std::scoped_lock lock(mutex_);
  if (const auto* state = roster_.find(id)) {
    return *state;
  }
  return std::nullopt;
}

common::Amount Ledger::total_net_balance() const {
  std::scoped_lock lock(mutex_);
  return roster_.total_net_balance();
}

accounts::Participant create_participant(std::string name) {
  return accounts::Participant{identity::default_generator().next(identity::IdKind::kParticipant),
                               std::move(name)};
}

CreateResult create_ledger(std::string name,
                           const std::vector<accounts::Participant>& participants,
                           std::string_view settlement_policy,
                           LedgerOptions options) {
  return Ledger::create(std::move(name), participants, settlement_policy, std::move(options));
}

}  // namespace ledger
}  // namespace splitcore
