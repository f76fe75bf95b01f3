#include "internal/service/ledger_service.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/settlement/settlement_tracker.hpp"
#include "internal/util/errors.hpp"
#include "internal/writeback/write_scheduler.hpp"
#include "internal/writeback/write_worker.hpp"

namespace settleup::service {

using observability::StringField;
using settlement::DebtSimplifier;
using settlement::SettlementTracker;

namespace {

bool NewerFirst(const model::Expense& a, const model::Expense& b) {
  if (a.created_at != b.created_at) {
    return a.created_at > b.created_at;
  }
  return a.id < b.id;
}

bool SameContent(const model::Expense& a, const model::Expense& b) {
  if (a.description != b.description || a.total_amount != b.total_amount || a.participants.size() != b.participants.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.participants.size(); ++i) {
    const auto& x = a.participants[i];
    const auto& y = b.participants[i];
    if (x.member_id != y.member_id || x.role != y.role || x.individual_amount != y.individual_amount) {
      return false;
    }
  }
  return true;
}

// Puts back the entry a failed create, edit or delete replaced. An entry that
// moved on since (a refresh, a later edit) is kept; status changes made on top
// of the failed edit are carried onto the restored entry.
std::optional<model::Expense> RevertEntry(const std::optional<model::Expense>& snapshot, const std::optional<model::Expense>& applied,
                                          std::optional<model::Expense> current) {
  if (current == applied) {
    return snapshot;
  }
  if (!snapshot || !applied || !current || !SameContent(*applied, *current)) {
    return current;
  }
  model::Expense reverted = *snapshot;
  for (auto& row : reverted.participants) {
    const auto* written = model::FindParticipant(*applied, row.member_id, row.role);
    const auto* now     = model::FindParticipant(*current, row.member_id, row.role);
    if (written != nullptr && now != nullptr && written->payment_status != now->payment_status) {
      row.payment_status = now->payment_status;
    }
  }
  return reverted;
}

std::future<void> Ready() {
  std::promise<void> promise;
  promise.set_value();
  return promise.get_future();
}

} // namespace

LedgerService::LedgerService(model::Scope scope, std::shared_ptr<db::ExpenseStore> store, ledger::ExpenseLedger expense_ledger,
                             double settle_threshold)
    : scope_(std::move(scope)),
      store_(std::move(store)),
      ledger_(std::move(expense_ledger)),
      settle_threshold_(settle_threshold),
      scheduler_(std::make_shared<writeback::WriteScheduler>()),
      worker_(std::make_unique<writeback::WriteWorker>(scheduler_)) {
  if (!store_) {
    throw util::InvalidArgument("ledger service requires a store");
  }
  if (scope_.group_id.empty()) {
    throw util::InvalidArgument("scope needs a group id");
  }
  worker_->Start();
}

LedgerService::~LedgerService() {
  // Queued writes reference this service; settle them before members go away.
  worker_->Stop();
}

void LedgerService::Refresh() {
  auto fresh = store_->List(scope_);
  std::sort(fresh.begin(), fresh.end(), NewerFirst);

  std::lock_guard lock(mutex_);
  expenses_ = std::move(fresh);
}

std::vector<model::Expense> LedgerService::Expenses() const {
  std::lock_guard lock(mutex_);
  return expenses_;
}

std::optional<model::Expense> LedgerService::Find(const std::string& expense_id) const {
  std::lock_guard lock(mutex_);
  return ReadLocked(expense_id);
}

LedgerService::Slot LedgerService::ReadLocked(const std::string& expense_id) const {
  auto it = std::find_if(expenses_.begin(), expenses_.end(), [&](const model::Expense& e) { return e.id == expense_id; });
  if (it == expenses_.end()) return std::nullopt;
  return *it;
}

void LedgerService::WriteLocked(const std::string& expense_id, Slot value) {
  auto it = std::find_if(expenses_.begin(), expenses_.end(), [&](const model::Expense& e) { return e.id == expense_id; });
  if (it != expenses_.end()) {
    expenses_.erase(it);
  }
  if (!value) {
    return;
  }
  auto pos = std::lower_bound(expenses_.begin(), expenses_.end(), *value, NewerFirst);
  expenses_.insert(pos, std::move(*value));
}

std::shared_ptr<LedgerService::Update> LedgerService::BeginLocked(const std::string& expense_id, const std::function<void(Slot&)>& apply,
                                                                  Update::Undo undo) {
  if (!undo) {
    undo = RevertEntry;
  }
  return std::make_shared<Update>([this, expense_id] { return ReadLocked(expense_id); },
                                  [this, expense_id](Slot value) { WriteLocked(expense_id, std::move(value)); }, apply, std::move(undo));
}

std::future<void> LedgerService::Submit(const std::string& operation, const std::string& expense_id, std::shared_ptr<Update> update,
                                        std::function<db::Result()> write) {
  auto promise = std::make_shared<std::promise<void>>();
  auto future  = promise->get_future();

  writeback::WriteTask task;
  task.operation  = operation;
  task.expense_id = expense_id;
  task.run        = [this, operation, expense_id, update, write = std::move(write), promise] {
    db::Result result;
    try {
      result = write();
    } catch (const std::exception& e) {
      result = db::Result::Err(db::ErrorCode::Unavailable, e.what());
    }

    {
      std::lock_guard lock(mutex_);
      if (result) {
        update->Commit();
      } else {
        update->Rollback();
      }
    }

    if (result) {
      SETTLEUP_LOG_DEBUG("Expense write committed", {StringField("operation", operation), StringField("expense_id", expense_id)});
      promise->set_value();
      return;
    }

    SETTLEUP_LOG_WARN("Expense write rejected, local change rolled back",
                      {StringField("operation", operation), StringField("expense_id", expense_id), StringField("error", result.message)});
    try {
      db::ThrowIfError(result, operation + " " + expense_id);
    } catch (const std::exception&) {
      promise->set_exception(std::current_exception());
    }
  };

  if (!scheduler_->Enqueue(std::move(task))) {
    std::lock_guard lock(mutex_);
    update->Rollback();
    throw util::InvalidState("ledger service is shutting down");
  }
  return future;
}

Submitted LedgerService::CreateExpense(ledger::ExpenseDraft draft) {
  if (draft.group_id.empty()) {
    draft.group_id = scope_.group_id;
  }
  if (!draft.event_id) {
    draft.event_id = scope_.event_id;
  }
  if (draft.group_id != scope_.group_id || (scope_.event_id && draft.event_id != scope_.event_id)) {
    throw util::InvalidArgument("expense does not belong to this ledger's scope");
  }

  auto expense = ledger_.Create(draft);

  std::shared_ptr<Update> update;
  {
    std::lock_guard lock(mutex_);
    update = BeginLocked(expense.id, [&expense](Slot& slot) { slot = expense; });
  }

  auto store  = store_;
  auto future = Submit("create", expense.id, std::move(update), [store, expense] { return store->Insert(expense); });
  SETTLEUP_LOG_INFO("Expense created", {StringField("expense_id", expense.id), StringField("group_id", expense.group_id),
                                        observability::DoubleField("total_amount", expense.total_amount)});
  return {std::move(expense), std::move(future)};
}

Submitted LedgerService::UpdateExpense(const std::string& expense_id, const ledger::ExpenseDraft& draft) {
  model::Expense          updated;
  std::shared_ptr<Update> update;
  {
    std::lock_guard lock(mutex_);
    auto            existing = ReadLocked(expense_id);
    if (!existing) {
      throw util::NotFound("expense " + expense_id);
    }
    updated = ledger_.Update(*existing, draft);
    update  = BeginLocked(expense_id, [&updated](Slot& slot) { slot = updated; });
  }

  auto store  = store_;
  auto future = Submit("update", expense_id, std::move(update), [store, updated] { return store->Replace(updated); });
  return {std::move(updated), std::move(future)};
}

std::future<void> LedgerService::DeleteExpense(const std::string& expense_id, const std::string& actor_id) {
  std::shared_ptr<Update> update;
  {
    std::lock_guard lock(mutex_);
    auto            existing = ReadLocked(expense_id);
    if (!existing) {
      throw util::NotFound("expense " + expense_id);
    }
    if (!ledger::ExpenseLedger::CanDelete(*existing, actor_id)) {
      throw util::PermissionDenied("only the creator can delete expense " + expense_id);
    }
    update = BeginLocked(expense_id, [](Slot& slot) { slot.reset(); });
  }

  auto store  = store_;
  auto future = Submit("delete", expense_id, std::move(update), [store, expense_id] { return store->Delete(expense_id); });
  SETTLEUP_LOG_INFO("Expense deleted", {StringField("expense_id", expense_id), StringField("actor_id", actor_id)});
  return future;
}

std::future<void> LedgerService::SetPaymentStatus(const std::string& expense_id, const std::string& member_id, model::Role role,
                                                  model::PaymentStatus status) {
  model::Participant      row;
  std::shared_ptr<Update> update;
  {
    std::lock_guard lock(mutex_);
    auto            existing = ReadLocked(expense_id);
    if (!existing) {
      throw util::NotFound("expense " + expense_id);
    }
    const auto* current = model::FindParticipant(*existing, member_id, role);
    if (current == nullptr) {
      throw util::NotFound("no " + std::string(model::ToString(role)) + " row for " + member_id + " in expense " + expense_id);
    }
    // Same status again: nothing to write.
    row = *current;
    if (!SettlementTracker::Advance(row, status)) {
      return Ready();
    }

    // A failed status write reverts only this row, and only while it still
    // shows the status written here.
    auto undo = [member_id, role](const Slot& snapshot, const Slot& applied, Slot current) {
      const auto* before = model::FindParticipant(*snapshot, member_id, role);
      const auto* after  = model::FindParticipant(*applied, member_id, role);
      auto*       now    = current ? model::FindParticipant(*current, member_id, role) : nullptr;
      if (now != nullptr && now->payment_status == after->payment_status) {
        now->payment_status = before->payment_status;
      }
      return current;
    };
    update = BeginLocked(
        expense_id,
        [&](Slot& slot) {
          auto* target = model::FindParticipant(*slot, member_id, role);
          SettlementTracker::Advance(*target, status);
        },
        std::move(undo));
  }

  auto store  = store_;
  auto future = Submit("payment_status", expense_id, std::move(update),
                       [store, expense_id, row] { return store->UpdatePaymentStatus(expense_id, row); });
  SETTLEUP_LOG_INFO("Payment status changed", {StringField("expense_id", expense_id), StringField("member_id", member_id),
                                               StringField("status", model::ToString(status))});
  return future;
}

balance::UserBalance LedgerService::Balance(const std::string& user_id) const {
  return balance::BalanceCalculator::Calculate(Expenses(), user_id);
}

std::vector<settlement::Transfer> LedgerService::GroupSettlement() const {
  return DebtSimplifier::Simplify(DebtSimplifier::GroupObligations(Expenses()), settle_threshold_);
}

std::vector<settlement::Transfer> LedgerService::SettlementFor(const std::string& user_id) const {
  const auto user_balance = balance::BalanceCalculator::Calculate(Expenses(), user_id);
  return DebtSimplifier::Simplify(DebtSimplifier::ObligationsFromBalance(user_id, user_balance), settle_threshold_);
}

ExpenseSummary LedgerService::Summary(const std::string& user_id) const {
  const auto expenses = Expenses();

  ExpenseSummary        summary;
  std::set<std::string> events;
  for (const auto& expense : expenses) {
    ++summary.expense_count;
    summary.total_amount += expense.total_amount;
    if (expense.event_id) {
      events.insert(*expense.event_id);
    }
  }
  summary.events_with_expenses = events.size();

  const auto active = SettlementTracker::ActiveExpenses(expenses);
  for (const auto& expense : active) {
    ++summary.active_expense_count;
    summary.active_total_amount += expense.total_amount;
  }
  summary.user_owes = balance::BalanceCalculator::Calculate(active, user_id).total_owing;
  return summary;
}

void LedgerService::Flush() {
  auto promise = std::make_shared<std::promise<void>>();
  auto done    = promise->get_future();

  writeback::WriteTask marker;
  marker.operation = "flush";
  marker.run       = [promise] { promise->set_value(); };
  if (!scheduler_->Enqueue(std::move(marker))) {
    return;
  }
  done.wait();
}

} // namespace settleup::service
