#include "internal/settlement/settlement_tracker.hpp"

#include <algorithm>
#include <iterator>

#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/optimistic.hpp"

namespace settleup::settlement {

using model::PaymentStatus;
using model::Role;

namespace {

bool AllCompleted(const model::Expense& expense, Role role) {
  return std::all_of(expense.participants.begin(), expense.participants.end(), [role](const model::Participant& row) {
    return row.role != role || row.payment_status == PaymentStatus::kCompleted;
  });
}

} // namespace

std::string_view ToString(OverallStatus status) {
  switch (status) {
    case OverallStatus::kPending:
      return "pending";
    case OverallStatus::kInProgress:
      return "in_progress";
    case OverallStatus::kCompleted:
      return "completed";
  }
  return "unknown";
}

bool SettlementTracker::IsFullySettled(const model::Expense& expense) {
  return AllCompleted(expense, Role::kOwer) || AllCompleted(expense, Role::kPayer);
}

OverallStatus SettlementTracker::Overall(const model::Expense& expense) {
  std::size_t owers     = 0;
  std::size_t sent      = 0;
  std::size_t completed = 0;
  for (const auto& row : expense.participants) {
    if (row.role != Role::kOwer) {
      continue;
    }
    ++owers;
    if (row.payment_status == PaymentStatus::kSent) ++sent;
    if (row.payment_status == PaymentStatus::kCompleted) ++completed;
  }

  if (owers == 0 || completed == owers) {
    return OverallStatus::kCompleted;
  }
  if (sent > 0 || completed > 0) {
    return OverallStatus::kInProgress;
  }
  return OverallStatus::kPending;
}

bool SettlementTracker::Advance(model::Participant& row, PaymentStatus status) {
  if (!model::CanTransition(row.payment_status, status)) {
    throw util::InvalidState("cannot move payment of " + row.member_id + " from " + std::string(model::ToString(row.payment_status)) + " to " +
                             std::string(model::ToString(status)));
  }
  if (row.payment_status == status) {
    return false;
  }
  row.payment_status = status;
  return true;
}

void SettlementTracker::SetPaymentStatus(model::Expense& expense, const std::string& member_id, Role role, PaymentStatus status,
                                         const PersistFn& persist) {
  auto* row = model::FindParticipant(expense, member_id, role);
  if (row == nullptr) {
    throw util::NotFound("no " + std::string(model::ToString(role)) + " row for " + member_id + " in expense " + expense.id);
  }

  util::OptimisticUpdate<model::Participant> update(*row, [status](model::Participant& target) { Advance(target, status); });
  if (update.Snapshot().payment_status == status) {
    update.Commit();
    return;
  }

  auto result = persist(expense.id, *row);
  if (!result) {
    update.Rollback();
    db::ThrowIfError(result, "update payment status");
  }
  update.Commit();
}

std::vector<model::Expense> SettlementTracker::ActiveExpenses(const std::vector<model::Expense>& expenses) {
  std::vector<model::Expense> active;
  std::copy_if(expenses.begin(), expenses.end(), std::back_inserter(active), [](const model::Expense& expense) { return !IsFullySettled(expense); });
  return active;
}

} // namespace settleup::settlement
