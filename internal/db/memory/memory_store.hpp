#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/expense_store.hpp"

namespace settleup::db::memory {

/*
  Process-local ExpenseStore.

  Keeps insertion order so List() is stable; used by the command line
  tool and by tests.
*/
class MemoryStore final : public ExpenseStore {
 public:
  MemoryStore();

  std::vector<model::Expense>   List(const model::Scope& scope) override;
  std::optional<model::Expense> Get(const std::string& expense_id) override;

  Result Insert(const model::Expense& expense) override;
  Result Replace(const model::Expense& expense) override;
  Result Delete(const std::string& expense_id) override;
  Result UpdatePaymentStatus(const std::string& expense_id, const model::Participant& row) override;

  std::size_t Size() const;

 private:
  mutable std::mutex                              mutex_;
  std::unordered_map<std::string, model::Expense> expenses_;
  std::vector<std::string>                        order_;
};

} // namespace settleup::db::memory
