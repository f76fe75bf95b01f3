#pragma once

#include <string>
#include <vector>

#include "internal/balance/balance_calculator.hpp"
#include "internal/model/expense.hpp"
#include "internal/model/money.hpp"

namespace settleup::settlement {

// from owes to amount.
struct Obligation {
  std::string from;
  std::string to;
  double      amount = 0.0;

  bool operator==(const Obligation&) const = default;
};

using Transfer = Obligation;

/*
  Pairwise netting of obligations.

  Each unordered pair {A, B} is keyed as (lo, hi) with lo < hi byte-wise.
  The pair's net is sum(lo -> hi) - sum(hi -> lo): positive means lo pays
  hi, negative means hi pays lo. Nets smaller than the threshold are
  dropped, as are obligations of a member to themselves.

  Output is ordered by pair key.
*/
class DebtSimplifier {
 public:
  static std::vector<Transfer> Simplify(const std::vector<Obligation>& obligations, double threshold = model::kSettleThreshold);

  // One user's debts (user -> payer) and credits (ower -> user).
  static std::vector<Obligation> ObligationsFromBalance(const std::string& user_id, const balance::UserBalance& user_balance);

  // Every ower owes every payer ower.amount * payer.amount / sum(payers).
  static std::vector<Obligation> GroupObligations(const std::vector<model::Expense>& expenses);
};

} // namespace settleup::settlement
