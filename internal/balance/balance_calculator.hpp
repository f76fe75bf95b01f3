#pragma once

#include <string>
#include <vector>

#include "internal/model/expense.hpp"

namespace settleup::balance {

/*
  One attributed share of one expense.

  In a credit the counterparty owes the user; in a debt the user owes the
  counterparty.
*/
struct DebtDetail {
  std::string expense_id;
  std::string expense_name;
  std::string counterparty;
  double      amount = 0.0;
};

struct UserBalance {
  double net_balance = 0.0;
  double total_owed  = 0.0;
  double total_owing = 0.0;

  std::vector<DebtDetail> detailed_debts;
  std::vector<DebtDetail> detailed_credits;
};

/*
  Proportional attribution of a user's position across expenses.

  For an expense the user paid part of, every ower's share is credited to
  the user in proportion to what the user paid. For an expense the user
  owes part of, every payer's row is debited in proportion to the user's
  share of the owed side. The two run independently, so a member who both
  paid and owes in one expense gets a credit and a debt for it.

  Stateless; safe to call concurrently over the same snapshot.
*/
class BalanceCalculator {
 public:
  static UserBalance Calculate(const std::vector<model::Expense>& expenses, const std::string& user_id);
};

} // namespace settleup::balance
