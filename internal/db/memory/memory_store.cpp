#include "memory_store.hpp"

#include <algorithm>

namespace settleup::db::memory {

MemoryStore::MemoryStore() = default;

std::vector<model::Expense> MemoryStore::List(const model::Scope& scope) {
  std::scoped_lock            lock(mutex_);
  std::vector<model::Expense> out;
  for (const auto& id : order_) {
    const auto& expense = expenses_.at(id);
    if (scope.Contains(expense)) {
      out.push_back(expense);
    }
  }
  return out;
}

std::optional<model::Expense> MemoryStore::Get(const std::string& expense_id) {
  std::scoped_lock lock(mutex_);
  auto             it = expenses_.find(expense_id);
  if (it == expenses_.end()) return std::nullopt;
  return it->second;
}

Result MemoryStore::Insert(const model::Expense& expense) {
  std::scoped_lock lock(mutex_);
  if (expenses_.contains(expense.id)) return Result::Err(ErrorCode::AlreadyExists, expense.id);
  expenses_[expense.id] = expense;
  order_.push_back(expense.id);
  return Result::Ok();
}

Result MemoryStore::Replace(const model::Expense& expense) {
  std::scoped_lock lock(mutex_);
  auto             it = expenses_.find(expense.id);
  if (it == expenses_.end()) return Result::Err(ErrorCode::NotFound, expense.id);
  it->second = expense;
  return Result::Ok();
}

Result MemoryStore::Delete(const std::string& expense_id) {
  std::scoped_lock lock(mutex_);
  if (expenses_.erase(expense_id) == 0) return Result::Err(ErrorCode::NotFound, expense_id);
  order_.erase(std::remove(order_.begin(), order_.end(), expense_id), order_.end());
  return Result::Ok();
}

Result MemoryStore::UpdatePaymentStatus(const std::string& expense_id, const model::Participant& row) {
  std::scoped_lock lock(mutex_);
  auto             it = expenses_.find(expense_id);
  if (it == expenses_.end()) return Result::Err(ErrorCode::NotFound, expense_id);

  auto* stored = model::FindParticipant(it->second, row.member_id, row.role);
  if (stored == nullptr) return Result::Err(ErrorCode::NotFound, "participant " + row.member_id);
  stored->payment_status = row.payment_status;
  return Result::Ok();
}

std::size_t MemoryStore::Size() const {
  std::scoped_lock lock(mutex_);
  return expenses_.size();
}

} // namespace settleup::db::memory
