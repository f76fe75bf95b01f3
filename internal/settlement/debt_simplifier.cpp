#include "internal/settlement/debt_simplifier.hpp"

#include <cmath>
#include <map>
#include <utility>

namespace settleup::settlement {

using model::Role;

std::vector<Transfer> DebtSimplifier::Simplify(const std::vector<Obligation>& obligations, double threshold) {
  std::map<std::pair<std::string, std::string>, double> nets;

  for (const auto& obligation : obligations) {
    if (obligation.from == obligation.to || !std::isfinite(obligation.amount)) {
      continue;
    }
    if (obligation.from < obligation.to) {
      nets[{obligation.from, obligation.to}] += obligation.amount;
    } else {
      nets[{obligation.to, obligation.from}] -= obligation.amount;
    }
  }

  std::vector<Transfer> transfers;
  for (const auto& [key, net] : nets) {
    if (std::fabs(net) < threshold) {
      continue;
    }
    const auto& [lo, hi] = key;
    if (net > 0.0) {
      transfers.push_back({lo, hi, net});
    } else {
      transfers.push_back({hi, lo, -net});
    }
  }
  return transfers;
}

std::vector<Obligation> DebtSimplifier::ObligationsFromBalance(const std::string& user_id, const balance::UserBalance& user_balance) {
  std::vector<Obligation> obligations;
  obligations.reserve(user_balance.detailed_debts.size() + user_balance.detailed_credits.size());

  for (const auto& debt : user_balance.detailed_debts) {
    obligations.push_back({user_id, debt.counterparty, debt.amount});
  }
  for (const auto& credit : user_balance.detailed_credits) {
    obligations.push_back({credit.counterparty, user_id, credit.amount});
  }
  return obligations;
}

std::vector<Obligation> DebtSimplifier::GroupObligations(const std::vector<model::Expense>& expenses) {
  std::vector<Obligation> obligations;

  for (const auto& expense : expenses) {
    const double total_paid = model::SumAmounts(expense, Role::kPayer);
    if (!(total_paid > 0.0)) {
      continue;
    }

    for (const auto& ower : expense.participants) {
      if (ower.role != Role::kOwer) {
        continue;
      }
      for (const auto& payer : expense.participants) {
        if (payer.role != Role::kPayer) {
          continue;
        }
        obligations.push_back({ower.member_id, payer.member_id, ower.individual_amount * payer.individual_amount / total_paid});
      }
    }
  }
  return obligations;
}

} // namespace settleup::settlement
