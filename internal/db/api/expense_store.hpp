#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/expense.hpp"

namespace settleup::db {

/*
  Persistence API for expenses.

  Implementations live outside this repository (REST backend) except for
  the in-memory store. Every call is a complete remote operation:

  - Insert/Replace carry the full participant set
  - Delete removes the expense with all its participants
  - UpdatePaymentStatus touches exactly one participant row
  - Concurrent writers resolve last-write-wins

  Calls may block; the ledger service only invokes them off the caller's
  thread.
*/
class ExpenseStore {
 public:
  virtual ~ExpenseStore() = default;

  virtual std::vector<model::Expense> List(const model::Scope& scope) = 0;

  virtual std::optional<model::Expense> Get(const std::string& expense_id) = 0;

  virtual Result Insert(const model::Expense& expense) = 0;

  virtual Result Replace(const model::Expense& expense) = 0;

  virtual Result Delete(const std::string& expense_id) = 0;

  virtual Result UpdatePaymentStatus(const std::string& expense_id, const model::Participant& row) = 0;
};

} // namespace settleup::db
