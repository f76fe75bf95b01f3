#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/balance/balance_calculator.hpp"
#include "internal/db/api/expense_store.hpp"
#include "internal/ledger/expense_ledger.hpp"
#include "internal/model/expense.hpp"
#include "internal/model/money.hpp"
#include "internal/settlement/debt_simplifier.hpp"
#include "internal/util/optimistic.hpp"

namespace settleup::writeback {
class WriteScheduler;
class WriteWorker;
} // namespace settleup::writeback

namespace settleup::service {

struct ExpenseSummary {
  std::size_t expense_count        = 0;
  double      total_amount         = 0.0;
  std::size_t active_expense_count = 0;
  double      active_total_amount  = 0.0;
  double      user_owes            = 0.0;
  std::size_t events_with_expenses = 0;
};

// A mutation as seen locally, plus the outcome of its remote write.
struct Submitted {
  model::Expense    expense;
  std::future<void> persisted;
};

/*
  Local view of one scope's expenses with optimistic mutations.

  Every mutation runs in three phases:
    1. validate and apply to the local cache (caller's thread)
    2. write to the store (background worker, FIFO)
    3. on store failure, revert this mutation's own change and fail the future

  A revert leaves alone whatever other mutations or a Refresh() wrote to the
  entry in the meantime.

  Validation and permission errors are thrown synchronously and leave the
  cache untouched. Store errors surface only through the returned future,
  mapped onto util error types.

  Reads and computations work on a snapshot of the cache, newest expense
  first.
*/
class LedgerService {
 public:
  LedgerService(model::Scope scope, std::shared_ptr<db::ExpenseStore> store, ledger::ExpenseLedger expense_ledger = ledger::ExpenseLedger(),
                double settle_threshold = model::kSettleThreshold);
  ~LedgerService();

  LedgerService(const LedgerService&)            = delete;
  LedgerService& operator=(const LedgerService&) = delete;

  const model::Scope& scope() const {
    return scope_;
  }

  // Replaces the cache with the store's view of the scope.
  void Refresh();

  std::vector<model::Expense>   Expenses() const;
  std::optional<model::Expense> Find(const std::string& expense_id) const;

  Submitted         CreateExpense(ledger::ExpenseDraft draft);
  Submitted         UpdateExpense(const std::string& expense_id, const ledger::ExpenseDraft& draft);
  std::future<void> DeleteExpense(const std::string& expense_id, const std::string& actor_id);
  std::future<void> SetPaymentStatus(const std::string& expense_id, const std::string& member_id, model::Role role,
                                     model::PaymentStatus status);

  // Balances and transfers cover every expense of the scope, whatever its
  // payment status.
  balance::UserBalance Balance(const std::string& user_id) const;

  // Pairwise netted transfers between all members.
  std::vector<settlement::Transfer> GroupSettlement() const;

  std::vector<settlement::Transfer> SettlementFor(const std::string& user_id) const;

  // Active totals and user_owes count only expenses not fully settled.
  ExpenseSummary Summary(const std::string& user_id) const;

  // Waits until every write submitted so far has settled.
  void Flush();

 private:
  using Slot   = std::optional<model::Expense>;
  using Update = util::OptimisticUpdate<Slot>;

  // Without an undo, a rollback restores the entry only while it still holds
  // what this update wrote.
  std::shared_ptr<Update> BeginLocked(const std::string& expense_id, const std::function<void(Slot&)>& apply, Update::Undo undo = nullptr);
  Slot                    ReadLocked(const std::string& expense_id) const;
  void                    WriteLocked(const std::string& expense_id, Slot value);

  std::future<void> Submit(const std::string& operation, const std::string& expense_id, std::shared_ptr<Update> update,
                           std::function<db::Result()> write);

  model::Scope                      scope_;
  std::shared_ptr<db::ExpenseStore> store_;
  ledger::ExpenseLedger             ledger_;
  double                            settle_threshold_;

  mutable std::mutex          mutex_;
  std::vector<model::Expense> expenses_;

  std::shared_ptr<writeback::WriteScheduler> scheduler_;
  std::unique_ptr<writeback::WriteWorker>    worker_;
};

} // namespace settleup::service
