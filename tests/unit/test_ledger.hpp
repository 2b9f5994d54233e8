#pragma once

namespace splitcore::tests {

void test_ledger_equal_split_scenario();
void test_ledger_exact_split_accumulates();
void test_ledger_settlement();
void test_ledger_rejections_leave_state_unchanged();
void test_ledger_conservation();
void test_ledger_passbook_snapshot();
void test_ledger_creation();
void test_ledger_custom_split_policy();
void test_ledger_rejects_oversized_shares();
void test_ledger_concurrent_writers();

}  // namespace splitcore::tests
