#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/expense.hpp"

namespace settleup::ledger {

/*
  What the editor submits: everything except identity and timestamps.
  Payer and ower rows usually come from split::Finalize, one call per role.
*/
struct ExpenseDraft {
  std::string                group_id;
  std::optional<std::string> event_id;
  std::string                description;
  double                     total_amount = 0.0;
  std::string                created_by;

  std::vector<model::Participant> participants;
};

struct LedgerOptions {
  std::string default_description = "Expense";
};

/*
  Validates drafts and assembles Expense records.

  Initial payment status policy: payers start completed (they fronted the
  money when the expense was entered), owers start pending.
*/
class ExpenseLedger {
 public:
  ExpenseLedger();
  explicit ExpenseLedger(LedgerOptions options);

  // Throws util::InvalidArgument when the draft violates an expense invariant.
  model::Expense Create(const ExpenseDraft& draft) const;

  // Full replace of description, total and participants.
  model::Expense Update(const model::Expense& existing, const ExpenseDraft& draft) const;

  static bool CanDelete(const model::Expense& expense, const std::string& actor_id);

  static void Validate(const model::Expense& expense);

  static model::PaymentStatus InitialStatus(model::Role role);

 private:
  std::string                     NormalizeDescription(const std::string& description) const;
  // Rows already present in existing keep their payment status.
  std::vector<model::Participant> WithInitialStatus(const std::vector<model::Participant>& rows,
                                                    const model::Expense*                 existing = nullptr) const;

  LedgerOptions options_;
};

} // namespace settleup::ledger
