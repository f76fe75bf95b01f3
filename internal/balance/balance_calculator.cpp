#include "internal/balance/balance_calculator.hpp"

namespace settleup::balance {

using model::Role;

namespace {

double UserAmount(const model::Expense& expense, const std::string& user_id, Role role) {
  double sum = 0.0;
  for (const auto& participant : expense.participants) {
    if (participant.role == role && participant.member_id == user_id) {
      sum += participant.individual_amount;
    }
  }
  return sum;
}

} // namespace

UserBalance BalanceCalculator::Calculate(const std::vector<model::Expense>& expenses, const std::string& user_id) {
  UserBalance balance;

  for (const auto& expense : expenses) {
    const double user_paid = UserAmount(expense, user_id, Role::kPayer);
    const double user_owes = UserAmount(expense, user_id, Role::kOwer);

    if (user_paid > 0.0) {
      const double total_paid = model::SumAmounts(expense, Role::kPayer);
      if (total_paid > 0.0) {
        const double payer_share = user_paid / total_paid;
        for (const auto& ower : expense.participants) {
          if (ower.role != Role::kOwer) {
            continue;
          }
          const double amount = ower.individual_amount * payer_share;
          balance.total_owed += amount;
          balance.detailed_credits.push_back({expense.id, expense.description, ower.member_id, amount});
        }
      }
    }

    if (user_owes > 0.0) {
      const double total_owed = model::SumAmounts(expense, Role::kOwer);
      if (total_owed > 0.0) {
        const double ower_share = user_owes / total_owed;
        for (const auto& payer : expense.participants) {
          if (payer.role != Role::kPayer) {
            continue;
          }
          const double amount = payer.individual_amount * ower_share;
          balance.total_owing += amount;
          balance.detailed_debts.push_back({expense.id, expense.description, payer.member_id, amount});
        }
      }
    }
  }

  balance.net_balance = balance.total_owed - balance.total_owing;
  return balance;
}

} // namespace settleup::balance
