#include "internal/ledger/expense_ledger.hpp"

#include <cmath>
#include <sstream>
#include <utility>
#include <unordered_set>

#include "internal/model/money.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace settleup::ledger {

using model::PaymentStatus;
using model::Role;

namespace {

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::string FormatAmount(double value) {
  std::ostringstream out;
  out.setf(std::ios::fixed);
  out.precision(2);
  out << value;
  return out.str();
}

void ValidateRole(const model::Expense& expense, Role role) {
  std::unordered_set<std::string> seen;
  double                          sum   = 0.0;
  std::size_t                     count = 0;

  for (const auto& participant : expense.participants) {
    if (participant.role != role) {
      continue;
    }
    if (participant.member_id.empty()) {
      throw util::InvalidArgument("participant without member id");
    }
    if (!seen.insert(participant.member_id).second) {
      throw util::InvalidArgument("member " + participant.member_id + " appears twice as " + std::string(model::ToString(role)));
    }
    if (!std::isfinite(participant.individual_amount) || participant.individual_amount < 0.0) {
      throw util::InvalidArgument("invalid amount for " + participant.member_id);
    }
    sum += participant.individual_amount;
    ++count;
  }

  if (count == 0) {
    throw util::InvalidArgument("expense needs at least one " + std::string(model::ToString(role)));
  }
  if (!model::NearlyEqual(sum, expense.total_amount)) {
    throw util::InvalidArgument(std::string(model::ToString(role)) + " shares add up to " + FormatAmount(sum) + ", expected " +
                                FormatAmount(expense.total_amount));
  }
}

} // namespace

ExpenseLedger::ExpenseLedger() = default;

ExpenseLedger::ExpenseLedger(LedgerOptions options) : options_(std::move(options)) {
}

PaymentStatus ExpenseLedger::InitialStatus(Role role) {
  return role == Role::kPayer ? PaymentStatus::kCompleted : PaymentStatus::kPending;
}

bool ExpenseLedger::CanDelete(const model::Expense& expense, const std::string& actor_id) {
  return !actor_id.empty() && expense.created_by == actor_id;
}

void ExpenseLedger::Validate(const model::Expense& expense) {
  if (expense.group_id.empty()) {
    throw util::InvalidArgument("expense needs a group");
  }
  if (!std::isfinite(expense.total_amount) || expense.total_amount <= 0.0) {
    throw util::InvalidArgument("total amount must be greater than 0");
  }
  ValidateRole(expense, Role::kPayer);
  ValidateRole(expense, Role::kOwer);
}

std::string ExpenseLedger::NormalizeDescription(const std::string& description) const {
  auto trimmed = Trim(description);
  return trimmed.empty() ? options_.default_description : trimmed;
}

std::vector<model::Participant> ExpenseLedger::WithInitialStatus(const std::vector<model::Participant>& rows,
                                                                 const model::Expense* existing) const {
  std::vector<model::Participant> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    auto        copy  = row;
    const auto* known = existing != nullptr ? model::FindParticipant(*existing, row.member_id, row.role) : nullptr;
    copy.payment_status = known != nullptr ? known->payment_status : InitialStatus(row.role);
    out.push_back(std::move(copy));
  }
  return out;
}

model::Expense ExpenseLedger::Create(const ExpenseDraft& draft) const {
  if (draft.created_by.empty()) {
    throw util::InvalidArgument("expense needs a creator");
  }

  model::Expense expense;
  expense.group_id     = draft.group_id;
  expense.event_id     = draft.event_id;
  expense.description  = NormalizeDescription(draft.description);
  expense.total_amount = draft.total_amount;
  expense.created_by   = draft.created_by;
  expense.participants = WithInitialStatus(draft.participants);

  Validate(expense);

  expense.id         = util::NewExpenseId();
  expense.created_at = util::Now();
  expense.updated_at = expense.created_at;
  return expense;
}

model::Expense ExpenseLedger::Update(const model::Expense& existing, const ExpenseDraft& draft) const {
  model::Expense expense = existing;
  expense.description    = NormalizeDescription(draft.description);
  expense.total_amount   = draft.total_amount;
  expense.participants   = WithInitialStatus(draft.participants, &existing);

  Validate(expense);

  expense.updated_at = util::Now();
  return expense;
}

} // namespace settleup::ledger
