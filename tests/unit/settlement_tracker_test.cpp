#include "internal/settlement/settlement_tracker.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace {

using settleup::db::ErrorCode;
using settleup::db::Result;
using settleup::model::Expense;
using settleup::model::Participant;
using settleup::model::PaymentStatus;
using settleup::model::Role;
using settleup::settlement::OverallStatus;
using settleup::settlement::SettlementTracker;

Expense MakeExpense(PaymentStatus payer_a, PaymentStatus payer_b, PaymentStatus ower_c, PaymentStatus ower_d) {
  Expense expense;
  expense.id           = "expense-1";
  expense.group_id     = "group-1";
  expense.total_amount = 20.0;
  expense.participants = {
      {"a", Role::kPayer, 10.0, payer_a},
      {"b", Role::kPayer, 10.0, payer_b},
      {"c", Role::kOwer, 10.0, ower_c},
      {"d", Role::kOwer, 10.0, ower_d},
  };
  return expense;
}

void TestStateMachineIsMonotonic() {
  using settleup::model::CanTransition;

  assert(CanTransition(PaymentStatus::kPending, PaymentStatus::kSent));
  assert(CanTransition(PaymentStatus::kSent, PaymentStatus::kCompleted));
  assert(CanTransition(PaymentStatus::kPending, PaymentStatus::kCompleted));
  assert(CanTransition(PaymentStatus::kSent, PaymentStatus::kSent));
  assert(!CanTransition(PaymentStatus::kSent, PaymentStatus::kPending));
  assert(!CanTransition(PaymentStatus::kCompleted, PaymentStatus::kSent));
  assert(!CanTransition(PaymentStatus::kCompleted, PaymentStatus::kPending));
}

void TestFullySettledWhenAllOwersCompleted() {
  auto expense = MakeExpense(PaymentStatus::kPending, PaymentStatus::kSent, PaymentStatus::kCompleted, PaymentStatus::kCompleted);
  assert(SettlementTracker::IsFullySettled(expense));
}

void TestFullySettledWhenAllPayersCompleted() {
  auto expense = MakeExpense(PaymentStatus::kCompleted, PaymentStatus::kCompleted, PaymentStatus::kPending, PaymentStatus::kSent);
  assert(SettlementTracker::IsFullySettled(expense));
}

void TestNotSettledWhenNeitherSideComplete() {
  auto expense = MakeExpense(PaymentStatus::kCompleted, PaymentStatus::kPending, PaymentStatus::kCompleted, PaymentStatus::kSent);
  assert(!SettlementTracker::IsFullySettled(expense));

  auto active = SettlementTracker::ActiveExpenses(
      {expense, MakeExpense(PaymentStatus::kCompleted, PaymentStatus::kCompleted, PaymentStatus::kPending, PaymentStatus::kPending)});
  assert(active.size() == 1);
  assert(active[0] == expense);
}

void TestOverallStatus() {
  assert(SettlementTracker::Overall(MakeExpense(PaymentStatus::kCompleted, PaymentStatus::kCompleted, PaymentStatus::kPending,
                                                PaymentStatus::kPending)) == OverallStatus::kPending);
  assert(SettlementTracker::Overall(MakeExpense(PaymentStatus::kCompleted, PaymentStatus::kCompleted, PaymentStatus::kSent,
                                                PaymentStatus::kPending)) == OverallStatus::kInProgress);
  assert(SettlementTracker::Overall(MakeExpense(PaymentStatus::kPending, PaymentStatus::kPending, PaymentStatus::kCompleted,
                                                PaymentStatus::kCompleted)) == OverallStatus::kCompleted);
  assert(settleup::settlement::ToString(OverallStatus::kInProgress) == "in_progress");
}

void TestAdvanceRejectsBackwardMove() {
  Participant row{"c", Role::kOwer, 10.0, PaymentStatus::kSent};

  assert(!SettlementTracker::Advance(row, PaymentStatus::kSent));
  assert(SettlementTracker::Advance(row, PaymentStatus::kCompleted));
  assert(row.payment_status == PaymentStatus::kCompleted);

  bool threw = false;
  try {
    SettlementTracker::Advance(row, PaymentStatus::kPending);
  } catch (const settleup::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(row.payment_status == PaymentStatus::kCompleted);
}

void TestSetPaymentStatusPersists() {
  auto expense = MakeExpense(PaymentStatus::kCompleted, PaymentStatus::kCompleted, PaymentStatus::kPending, PaymentStatus::kPending);

  int         calls = 0;
  Participant written;
  SettlementTracker::SetPaymentStatus(expense, "c", Role::kOwer, PaymentStatus::kSent, [&](const std::string& id, const Participant& row) {
    ++calls;
    assert(id == "expense-1");
    written = row;
    return Result::Ok();
  });

  assert(calls == 1);
  assert(written.member_id == "c");
  assert(written.payment_status == PaymentStatus::kSent);
  assert(expense.participants[2].payment_status == PaymentStatus::kSent);

  // Same status again does not reach the store.
  SettlementTracker::SetPaymentStatus(expense, "c", Role::kOwer, PaymentStatus::kSent, [&](const std::string&, const Participant&) {
    ++calls;
    return Result::Ok();
  });
  assert(calls == 1);
}

void TestSetPaymentStatusRollsBackOnFailure() {
  auto expense = MakeExpense(PaymentStatus::kCompleted, PaymentStatus::kCompleted, PaymentStatus::kPending, PaymentStatus::kPending);

  PaymentStatus seen_during_write = PaymentStatus::kPending;
  bool          threw             = false;
  try {
    SettlementTracker::SetPaymentStatus(expense, "d", Role::kOwer, PaymentStatus::kCompleted,
                                        [&](const std::string&, const Participant&) {
                                          seen_during_write = expense.participants[3].payment_status;
                                          return Result::Err(ErrorCode::Unavailable, "backend down");
                                        });
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw);
  assert(seen_during_write == PaymentStatus::kCompleted);
  assert(expense.participants[3].payment_status == PaymentStatus::kPending);
}

void TestSetPaymentStatusUnknownRow() {
  auto expense = MakeExpense(PaymentStatus::kCompleted, PaymentStatus::kCompleted, PaymentStatus::kPending, PaymentStatus::kPending);

  bool threw = false;
  try {
    SettlementTracker::SetPaymentStatus(expense, "a", Role::kOwer, PaymentStatus::kSent,
                                        [](const std::string&, const Participant&) { return Result::Ok(); });
  } catch (const settleup::util::NotFound&) {
    threw = true;
  }
  assert(threw && "payer a has no ower row");
}

} // namespace

int main() {
  TestStateMachineIsMonotonic();
  TestFullySettledWhenAllOwersCompleted();
  TestFullySettledWhenAllPayersCompleted();
  TestNotSettledWhenNeitherSideComplete();
  TestOverallStatus();
  TestAdvanceRejectsBackwardMove();
  TestSetPaymentStatusPersists();
  TestSetPaymentStatusRollsBackOnFailure();
  TestSetPaymentStatusUnknownRow();

  std::cout << "settleup_unit_settlement_tracker: pass\n";
  return 0;
}
