#include "test_ledger.hpp"

#include <cassert>
#include <cstdint>
#include <limits>
#include <memory>
#include <string_view>
#include <thread>
#include <vector>

#include "splitcore/identity/id_generator.hpp"
#include "splitcore/ledger/ledger.hpp"

namespace splitcore::tests {

namespace {

struct Trip {
  accounts::Participant alice = ledger::create_participant("Alice");
  accounts::Participant bob = ledger::create_participant("Bob");
  accounts::Participant charlie = ledger::create_participant("Charlie");
  std::unique_ptr<ledger::Ledger> group;

  explicit Trip(std::string_view settlement_policy = "direct_pairwise") {
    auto created = ledger::create_ledger("Goa Trip", {alice, bob, charlie}, settlement_policy);
    assert(created.status == common::Status::kOk);
    group = std::move(created.ledger);
  }

  // Alice pays 300.00 split three ways.
  void scenario_a() {
    auto result = group->add_expense(alice.id(), 30'000, common::SplitType::kEqual);
    assert(result.status == common::Status::kOk);
  }

  // Bob pays 400.00: Alice 100, Bob 200, Charlie 100.
  void scenario_b() {
    auto result = group->add_expense(
        bob.id(), 40'000, common::SplitType::kExact,
        common::ShareMap{{alice.id(), 10'000}, {bob.id(), 20'000}, {charlie.id(), 10'000}},
        "Scuba diving");
    assert(result.status == common::Status::kOk);
  }
};

}  // namespace

void test_ledger_equal_split_scenario() {
  Trip trip;
  trip.scenario_a();

  const common::Passbook expected{
      {trip.bob.id(), {{trip.alice.id(), 10'000}}},
      {trip.charlie.id(), {{trip.alice.id(), 10'000}}},
  };
  assert(trip.group->get_passbook() == expected);

  const auto expenses = trip.group->expenses();
  assert(expenses.size() == 1);
  assert(expenses[0].payer() == trip.alice.id());
  assert(expenses[0].split_type() == "EQUAL");
  assert(expenses[0].share_of(trip.alice.id()) == 10'000);  // computed, not applied
  assert(expenses[0].split_total() == 30'000);
  assert(identity::IdGenerator::is_well_formed(identity::IdKind::kExpense, expenses[0].id()));

  const auto alice = trip.group->participant(trip.alice.id());
  assert(alice.has_value());
  assert(alice->balance_with(trip.bob.id()) == 10'000);
  assert(alice->balance_with(trip.charlie.id()) == 10'000);
  assert(alice->balance_with(trip.alice.id()) == 0);
  assert(trip.group->participant(trip.bob.id())->balance_with(trip.alice.id()) == -10'000);
  assert(trip.group->total_net_balance() == 0);

  // The caller's copies are not the ledger's state
  assert(trip.alice.balances().empty());
}

void test_ledger_exact_split_accumulates() {
  Trip trip;
  trip.scenario_a();
  trip.scenario_b();

  const auto passbook = trip.group->get_passbook();
  assert(passbook.at(trip.alice.id()).at(trip.bob.id()) == 10'000);
  assert(passbook.at(trip.charlie.id()).at(trip.bob.id()) == 10'000);
  assert(passbook.at(trip.charlie.id()).at(trip.alice.id()) == 10'000);
  // Opposite-direction pair entries are kept apart, not netted
  assert(passbook.at(trip.bob.id()).at(trip.alice.id()) == 10'000);
  assert(passbook.size() == 3);

  // Participant balances do net per counterparty
  const auto alice = *trip.group->participant(trip.alice.id());
  assert(alice.balance_with(trip.bob.id()) == 0);
  assert(alice.balance_with(trip.charlie.id()) == 10'000);

  // A second expense on the same pair accumulates
  auto again = trip.group->add_expense(trip.alice.id(), 30'000, common::SplitType::kEqual);
  assert(again.status == common::Status::kOk);
  assert(trip.group->outstanding(trip.bob.id(), trip.alice.id()) == 20'000);
  assert(trip.group->expense_count() == 3);
  assert(trip.group->total_net_balance() == 0);
}

void test_ledger_settlement() {
  Trip trip;
  trip.scenario_a();

  auto over = trip.group->settle(trip.bob.id(), trip.alice.id(), 10'001);
  assert(over.status == common::Status::kSettlementExceedsBalance);
  assert(over.reject_code == 3007);
  assert(trip.group->outstanding(trip.bob.id(), trip.alice.id()) == 10'000);

  auto partial = trip.group->settle(trip.bob.id(), trip.alice.id(), 2'500);
  assert(partial.status == common::Status::kOk);
  assert(partial.remaining == 7'500);
  assert(trip.group->outstanding(trip.bob.id(), trip.alice.id()) == 7'500);

  auto rest = trip.group->settle(trip.bob.id(), trip.alice.id(), 7'500);
  assert(rest.status == common::Status::kOk);
  assert(rest.remaining == 0);
  assert(trip.group->get_passbook().count(trip.bob.id()) == 0);
  assert(trip.group->participant(trip.bob.id())->balances().empty());
  assert(trip.group->total_net_balance() == 0);

  auto repeat = trip.group->settle(trip.bob.id(), trip.alice.id(), 7'500);
  assert(repeat.status == common::Status::kNoOutstandingBalance);
  assert(repeat.reject_code == 3006);

  // Scenario C after B: Bob still owes Alice from the first expense
  Trip full;
  full.scenario_a();
  full.scenario_b();
  auto settled = full.group->settle(full.bob.id(), full.alice.id(), 10'000);
  assert(settled.status == common::Status::kOk);
  assert(full.group->outstanding(full.bob.id(), full.alice.id()) == 0);
  assert(full.group->outstanding(full.alice.id(), full.bob.id()) == 10'000);
  assert(full.group->total_net_balance() == 0);
  assert(full.group->settle(full.bob.id(), full.alice.id(), 10'000).status ==
         common::Status::kNoOutstandingBalance);

  // Graph-minimizing is selectable but refuses to settle
  Trip graph{"graph_minimizing"};
  graph.scenario_a();
  auto unimplemented = graph.group->settle(graph.bob.id(), graph.alice.id(), 5'000);
  assert(unimplemented.status == common::Status::kSettlementPolicyUnimplemented);
  assert(graph.group->outstanding(graph.bob.id(), graph.alice.id()) == 10'000);
}

void test_ledger_rejections_leave_state_unchanged() {
  Trip trip;
  trip.scenario_a();

  const auto passbook = trip.group->get_passbook();
  const auto alice_before = trip.group->participant(trip.alice.id())->balances();

  auto check_unchanged = [&]() {
    assert(trip.group->expense_count() == 1);
    assert(trip.group->get_passbook() == passbook);
    assert(trip.group->participant(trip.alice.id())->balances() == alice_before);
    assert(trip.group->total_net_balance() == 0);
  };

  // Scenario D
  auto missing = trip.group->add_expense(trip.alice.id(), 10'000, common::SplitType::kExact);
  assert(missing.status == common::Status::kMissingCustomShares);
  assert(missing.reject_code == 3003);
  assert(missing.expense_id.empty());
  check_unchanged();

  auto mismatch = trip.group->add_expense(trip.alice.id(), 10'000, common::SplitType::kExact,
                                          common::ShareMap{{trip.bob.id(), 9'999}});
  assert(mismatch.status == common::Status::kSplitSumMismatch);
  check_unchanged();

  auto percent = trip.group->add_expense(trip.alice.id(), 10'000, common::SplitType::kPercentage,
                                         common::ShareMap{{trip.bob.id(), 9'000}});
  assert(percent.status == common::Status::kPercentageSumMismatch);
  check_unchanged();

  auto unknown_type = trip.group->add_expense({.payer = trip.alice.id(), .amount = 10'000, .split_type = "BY_WEIGHT"});
  assert(unknown_type.status == common::Status::kUnknownSplitType);
  check_unchanged();

  auto stranger = ledger::create_participant("Mallory");
  auto unknown_payer = trip.group->add_expense(stranger.id(), 10'000, common::SplitType::kEqual);
  assert(unknown_payer.status == common::Status::kUnknownParticipant);
  auto foreign_share = trip.group->add_expense(trip.alice.id(), 10'000, common::SplitType::kExact,
                                               common::ShareMap{{stranger.id(), 10'000}});
  assert(foreign_share.status == common::Status::kUnknownParticipant);
  check_unchanged();

  assert(trip.group->add_expense(trip.alice.id(), 0, common::SplitType::kEqual).status ==
         common::Status::kInvalidAmount);
  assert(trip.group->add_expense(trip.alice.id(), -100, common::SplitType::kEqual).status ==
         common::Status::kInvalidAmount);
  assert(trip.group->add_expense(trip.alice.id(), common::kMaxAmount + 1, common::SplitType::kEqual).status ==
         common::Status::kInvalidAmount);
  check_unchanged();

  assert(trip.group->settle(trip.bob.id(), stranger.id(), 100).status == common::Status::kUnknownParticipant);
  assert(trip.group->settle(trip.bob.id(), trip.bob.id(), 100).status == common::Status::kSelfSettlement);
  assert(trip.group->settle(trip.bob.id(), trip.alice.id(), 0).status == common::Status::kInvalidAmount);
  assert(trip.group->settle(trip.alice.id(), trip.bob.id(), 100).status == common::Status::kNoOutstandingBalance);
  assert(trip.group->settle(trip.bob.id(), trip.alice.id(), 10'001).status ==
         common::Status::kSettlementExceedsBalance);
  check_unchanged();
}

void test_ledger_conservation() {
  Trip trip;
  const auto a = trip.alice.id();
  const auto b = trip.bob.id();
  const auto c = trip.charlie.id();

  auto expect_balanced = [&]() {
    assert(trip.group->total_net_balance() == 0);
    common::Amount total = 0;
    for (const auto& participant : trip.group->participants()) {
      total += participant.net_balance();
    }
    assert(total == 0);
    for (const auto& expense : trip.group->expenses()) {
      assert(expense.split_total() == expense.amount());
    }
  };

  assert(trip.group->add_expense(a, 10'001, common::SplitType::kEqual).status == common::Status::kOk);
  expect_balanced();
  assert(trip.group->add_expense(c, 9'999, common::SplitType::kPercentage,
                                 common::ShareMap{{a, 3'333}, {b, 3'333}, {c, 3'334}})
             .status == common::Status::kOk);
  expect_balanced();
  assert(trip.group->add_expense(b, 12'345, common::SplitType::kExact,
                                 common::ShareMap{{a, 12'000}, {c, 345}})
             .status == common::Status::kOk);
  expect_balanced();
  assert(trip.group->settle(a, b, 6'000).status == common::Status::kOk);
  expect_balanced();
  assert(trip.group->settle(c, a, trip.group->outstanding(c, a)).status == common::Status::kOk);
  expect_balanced();
  assert(trip.group->settle(b, c, 1).status == common::Status::kOk);
  expect_balanced();
}

void test_ledger_passbook_snapshot() {
  Trip trip;
  trip.scenario_a();
  trip.scenario_b();

  const auto first = trip.group->get_passbook();
  const auto second = trip.group->get_passbook();
  assert(first == second);

  auto copy = trip.group->get_passbook();
  copy[trip.bob.id()][trip.alice.id()] = 1;
  copy[trip.alice.id()].clear();
  assert(trip.group->get_passbook() == first);

  // Reads never create entries
  assert(trip.group->outstanding(trip.alice.id(), trip.charlie.id()) == 0);
  assert(trip.group->get_passbook() == first);
}

void test_ledger_creation() {
  auto alice = ledger::create_participant("Alice");
  auto bob = ledger::create_participant("Bob");
  assert(alice.id() != bob.id());
  assert(identity::IdGenerator::is_well_formed(identity::IdKind::kParticipant, alice.id()));

  auto unknown = ledger::create_ledger("Trip", {alice, bob}, "heap_based");
  assert(unknown.status == common::Status::kUnknownSettlementPolicy);
  assert(unknown.reject_code == 3002);
  assert(!unknown.ledger);

  auto empty = ledger::create_ledger("Trip", {}, "direct_pairwise");
  assert(empty.status == common::Status::kEmptyParticipantSet);

  auto duplicate = ledger::create_ledger("Trip", {alice, bob, alice}, "direct_pairwise");
  assert(duplicate.status == common::Status::kDuplicateParticipant);

  auto created = ledger::create_ledger("Trip", {bob, alice}, "direct_pairwise");
  assert(created.status == common::Status::kOk);
  assert(created.ledger->name() == "Trip");
  assert(created.ledger->settlement_policy() == "direct_pairwise");
  assert(identity::IdGenerator::is_well_formed(identity::IdKind::kLedger, created.ledger->id()));

  const auto members = created.ledger->participants();
  assert(members.size() == 2);
  assert(members[0].id() == bob.id());
  assert(members[1].name() == "Alice");
}

void test_ledger_custom_split_policy() {
  // Payer covers everything; nobody else owes.
  class PayerTakesAll final : public split::SplitPolicy {
   public:
    split::SplitResult split(const split::SplitRequest& request) const override {
      return split::SplitResult{.shares = {{request.payer, request.amount}}};
    }
  };

  // Claims more than the expense amount.
  class Inflating final : public split::SplitPolicy {
   public:
    split::SplitResult split(const split::SplitRequest& request) const override {
      return split::SplitResult{.shares = {{request.payer, request.amount + 1}}};
    }
  };

  auto splits = std::make_shared<split::Registry>(split::Registry::with_builtins());
  splits->register_policy("TREAT", std::make_shared<PayerTakesAll>());
  splits->register_policy("INFLATE", std::make_shared<Inflating>());

  auto settlements = std::make_shared<settlement::Registry>();
  settlements->register_policy("pairwise", std::make_shared<settlement::DirectPairwiseSettlement>());

  auto alice = ledger::create_participant("Alice");
  auto bob = ledger::create_participant("Bob");
  auto created = ledger::create_ledger("Dinner", {alice, bob}, "pairwise",
                                       {.split_policies = splits, .settlement_policies = settlements});
  assert(created.status == common::Status::kOk);
  auto& group = *created.ledger;

  assert(group.add_expense({.payer = alice.id(), .amount = 5'000, .split_type = "TREAT"}).status ==
         common::Status::kOk);
  assert(group.get_passbook().empty());
  assert(group.total_net_balance() == 0);

  assert(group.add_expense({.payer = alice.id(), .amount = 5'000, .split_type = "INFLATE"}).status ==
         common::Status::kSplitSumMismatch);
  assert(group.expense_count() == 1);

  assert(group.add_expense(bob.id(), 5'000, common::SplitType::kEqual).status == common::Status::kOk);
  assert(group.outstanding(alice.id(), bob.id()) == 2'500);
}

void test_ledger_rejects_oversized_shares() {
  constexpr auto kHuge = std::numeric_limits<std::int64_t>::max();

  Trip trip;
  trip.scenario_a();
  const auto passbook = trip.group->get_passbook();

  auto exact = trip.group->add_expense(
      trip.alice.id(), 100, common::SplitType::kExact,
      common::ShareMap{{trip.alice.id(), kHuge}, {trip.bob.id(), kHuge}, {trip.charlie.id(), 102}});
  assert(exact.status == common::Status::kSplitSumMismatch);
  assert(exact.expense_id.empty());

  auto percent = trip.group->add_expense(
      trip.alice.id(), 100, common::SplitType::kPercentage,
      common::ShareMap{{trip.alice.id(), kHuge}, {trip.bob.id(), kHuge}, {trip.charlie.id(), 10'002}});
  assert(percent.status == common::Status::kPercentageSumMismatch);

  assert(trip.group->expense_count() == 1);
  assert(trip.group->get_passbook() == passbook);
  assert(trip.group->total_net_balance() == 0);

  // A registered policy whose output wraps around int64 is caught after the split
  class Wrapping final : public split::SplitPolicy {
   public:
    split::SplitResult split(const split::SplitRequest& request) const override {
      split::SplitResult result;
      result.shares[request.participants[0]] = std::numeric_limits<std::int64_t>::max();
      result.shares[request.participants[1]] = std::numeric_limits<std::int64_t>::max();
      result.shares[request.participants[2]] = request.amount + 2;
      return result;
    }
  };

  auto splits = std::make_shared<split::Registry>(split::Registry::with_builtins());
  splits->register_policy("WRAP", std::make_shared<Wrapping>());
  auto created = ledger::create_ledger("Goa Trip", {trip.alice, trip.bob, trip.charlie}, "direct_pairwise",
                                       {.split_policies = splits});
  assert(created.status == common::Status::kOk);
  auto& group = *created.ledger;

  auto wrapped = group.add_expense({.payer = trip.alice.id(), .amount = 100, .split_type = "WRAP"});
  assert(wrapped.status == common::Status::kSplitSumMismatch);
  assert(group.expense_count() == 0);
  assert(group.get_passbook().empty());
  assert(group.participant(trip.bob.id())->balances().empty());
}

void test_ledger_concurrent_writers() {
  Trip trip;
  const std::vector<common::ParticipantId> payers = {trip.alice.id(), trip.bob.id(), trip.charlie.id()};

  std::vector<std::thread> writers;
  for (const auto& payer : payers) {
    writers.emplace_back([&trip, payer]() {
      for (int i = 0; i < 100; ++i) {
        auto result = trip.group->add_expense(payer, 301, common::SplitType::kEqual);
        assert(result.status == common::Status::kOk);
        (void)result;
        (void)trip.group->get_passbook();
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }

  assert(trip.group->expense_count() == 300);
  assert(trip.group->total_net_balance() == 0);
  // Each payer's 301 splits 101/100/100 in roster order
  assert(trip.group->outstanding(trip.bob.id(), trip.alice.id()) == 100 * 100);
  assert(trip.group->outstanding(trip.alice.id(), trip.bob.id()) == 100 * 101);
}

}  // namespace splitcore::tests
