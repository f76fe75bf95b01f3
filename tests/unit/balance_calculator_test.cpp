#include "internal/balance/balance_calculator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/money.hpp"

namespace {

using settleup::balance::BalanceCalculator;
using settleup::model::Expense;
using settleup::model::NearlyEqual;
using settleup::model::Participant;
using settleup::model::PaymentStatus;
using settleup::model::Role;

Participant Payer(const std::string& id, double amount) {
  return {id, Role::kPayer, amount, PaymentStatus::kCompleted};
}

Participant Ower(const std::string& id, double amount) {
  return {id, Role::kOwer, amount, PaymentStatus::kPending};
}

Expense MakeExpense(const std::string& id, double total, std::vector<Participant> participants) {
  Expense expense;
  expense.id           = id;
  expense.group_id     = "group-1";
  expense.description  = "expense " + id;
  expense.total_amount = total;
  expense.created_by   = participants.front().member_id;
  expense.participants = std::move(participants);
  return expense;
}

void TestSinglePayerScenario() {
  std::vector<Expense> expenses = {MakeExpense("e1", 100.0, {Payer("A", 100.0), Ower("B", 60.0), Ower("C", 40.0)})};

  auto a = BalanceCalculator::Calculate(expenses, "A");
  assert(NearlyEqual(a.total_owed, 100.0));
  assert(NearlyEqual(a.total_owing, 0.0));
  assert(NearlyEqual(a.net_balance, 100.0));
  assert(a.detailed_debts.empty());
  assert(a.detailed_credits.size() == 2);
  assert(a.detailed_credits[0].counterparty == "B");
  assert(NearlyEqual(a.detailed_credits[0].amount, 60.0));
  assert(a.detailed_credits[0].expense_id == "e1");
  assert(a.detailed_credits[0].expense_name == "expense e1");
  assert(a.detailed_credits[1].counterparty == "C");
  assert(NearlyEqual(a.detailed_credits[1].amount, 40.0));

  auto b = BalanceCalculator::Calculate(expenses, "B");
  assert(NearlyEqual(b.total_owing, 60.0));
  assert(NearlyEqual(b.total_owed, 0.0));
  assert(NearlyEqual(b.net_balance, -60.0));
  assert(b.detailed_debts.size() == 1);
  assert(b.detailed_debts[0].counterparty == "A");
}

void TestSharedPayersAttributeProportionally() {
  std::vector<Expense> expenses = {MakeExpense("e1", 100.0, {Payer("A", 60.0), Payer("B", 40.0), Ower("C", 50.0), Ower("D", 50.0)})};

  auto a = BalanceCalculator::Calculate(expenses, "A");
  assert(NearlyEqual(a.total_owed, 60.0));
  assert(NearlyEqual(a.detailed_credits[0].amount, 30.0));

  auto c = BalanceCalculator::Calculate(expenses, "C");
  assert(NearlyEqual(c.total_owing, 50.0));
  assert(c.detailed_debts.size() == 2);
  assert(c.detailed_debts[0].counterparty == "A");
  assert(NearlyEqual(c.detailed_debts[0].amount, 30.0));
  assert(c.detailed_debts[1].counterparty == "B");
  assert(NearlyEqual(c.detailed_debts[1].amount, 20.0));
}

void TestBalancesAccumulateAcrossExpenses() {
  std::vector<Expense> expenses = {
      MakeExpense("e1", 30.0, {Payer("A", 30.0), Ower("B", 30.0)}),
      MakeExpense("e2", 50.0, {Payer("B", 50.0), Ower("A", 50.0)}),
  };

  auto a = BalanceCalculator::Calculate(expenses, "A");
  assert(NearlyEqual(a.total_owed, 30.0));
  assert(NearlyEqual(a.total_owing, 50.0));
  assert(NearlyEqual(a.net_balance, -20.0));
}

void TestPayerAndOwerStayIndependent() {
  std::vector<Expense> expenses = {MakeExpense("e1", 100.0, {Payer("A", 100.0), Ower("A", 50.0), Ower("B", 50.0)})};

  auto a = BalanceCalculator::Calculate(expenses, "A");
  assert(a.detailed_credits.size() == 2);
  assert(a.detailed_debts.size() == 1);
  assert(a.detailed_debts[0].counterparty == "A");
  assert(NearlyEqual(a.total_owed, 100.0));
  assert(NearlyEqual(a.total_owing, 50.0));
  assert(NearlyEqual(a.net_balance, 50.0));
}

void TestEmptyListYieldsZeros() {
  auto balance = BalanceCalculator::Calculate({}, "A");
  assert(balance.net_balance == 0.0);
  assert(balance.total_owed == 0.0);
  assert(balance.total_owing == 0.0);
  assert(balance.detailed_debts.empty());
  assert(balance.detailed_credits.empty());

  auto outsider = BalanceCalculator::Calculate({MakeExpense("e1", 10.0, {Payer("A", 10.0), Ower("B", 10.0)})}, "Z");
  assert(outsider.net_balance == 0.0);
  assert(outsider.detailed_credits.empty());
}

void TestZeroDenominatorMeansNoAttribution() {
  // Rows that bypassed validation: the owed side sums to zero.
  Expense broken = MakeExpense("e1", 10.0, {Payer("A", 10.0), Ower("B", 0.0)});

  auto a = BalanceCalculator::Calculate({broken}, "A");
  assert(std::isfinite(a.net_balance));
  assert(NearlyEqual(a.total_owed, 0.0));

  auto b = BalanceCalculator::Calculate({broken}, "B");
  assert(std::isfinite(b.net_balance));
  assert(b.detailed_debts.empty());
}

} // namespace

int main() {
  TestSinglePayerScenario();
  TestSharedPayersAttributeProportionally();
  TestBalancesAccumulateAcrossExpenses();
  TestPayerAndOwerStayIndependent();
  TestEmptyListYieldsZeros();
  TestZeroDenominatorMeansNoAttribution();

  std::cout << "settleup_unit_balance_calculator: pass\n";
  return 0;
}
