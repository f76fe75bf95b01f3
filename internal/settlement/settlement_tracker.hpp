#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/expense.hpp"

namespace settleup::settlement {

enum class OverallStatus {
  kPending,
  kInProgress,
  kCompleted,
};

std::string_view ToString(OverallStatus status);

/*
  Payment progress of expenses.

  Each participant row moves pending -> sent -> completed and never back.
  An expense counts as settled once either side is fully completed; see
  IsFullySettled.
*/
class SettlementTracker {
 public:
  // Remote write of one row's new status.
  using PersistFn = std::function<db::Result(const std::string& expense_id, const model::Participant& row)>;

  /*
    True iff all ower rows are completed OR all payer rows are completed.

    Either side can close the expense on its own: owers by paying, payers
    by confirming receipt. Views filtering "active" expenses rely on this.
    It is intentionally not an AND; product review pending.
  */
  static bool IsFullySettled(const model::Expense& expense);

  // List view aggregate over ower rows.
  static OverallStatus Overall(const model::Expense& expense);

  // Throws util::InvalidState on a backward move. Returns false when the
  // row already had the status.
  static bool Advance(model::Participant& row, model::PaymentStatus status);

  /*
    Optimistic status change: apply to the row, persist, and restore the
    previous status if persist fails. The store error is rethrown.
  */
  static void SetPaymentStatus(model::Expense& expense, const std::string& member_id, model::Role role, model::PaymentStatus status,
                               const PersistFn& persist);

  static std::vector<model::Expense> ActiveExpenses(const std::vector<model::Expense>& expenses);
};

} // namespace settleup::settlement
