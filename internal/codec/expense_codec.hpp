#pragma once

#include <string>
#include <vector>

#include <google/protobuf/message.h>

#include "internal/balance/balance_calculator.hpp"
#include "internal/directory/member_directory.hpp"
#include "internal/model/expense.hpp"
#include "internal/settlement/debt_simplifier.hpp"
#include "settleup/ledger/v1.hpp"

namespace settleup::codec {

/*
  Conversion between wire messages and validated model records.

  Decoding is where loosely typed transport data becomes typed records:
  unknown role/status strings, non-finite amounts and expenses breaking
  the ledger invariants are rejected with util::InvalidArgument.
*/

model::Expense     FromProto(const settleup::ledger::v1::Expense& proto);
model::Participant FromProto(const settleup::ledger::v1::Participant& proto);
model::Member      FromProto(const settleup::ledger::v1::Member& proto);

settleup::ledger::v1::Expense     ToProto(const model::Expense& expense);
settleup::ledger::v1::Participant ToProto(const model::Participant& participant);

// Display names are filled in only when a directory is given.
settleup::ledger::v1::UserBalance ToProto(const std::string& user_id, const balance::UserBalance& user_balance,
                                          const directory::MemberDirectory* members = nullptr);
settleup::ledger::v1::Transfer    ToProto(const settlement::Transfer& transfer, const directory::MemberDirectory* members = nullptr);

std::vector<model::Expense> DecodeExpenses(const settleup::ledger::v1::ExpenseList& list);
std::vector<model::Member>  DecodeMembers(const settleup::ledger::v1::ExpenseList& list);

/*
  JSON transport mapping.

  Parsing ignores unknown fields (the backend adds columns freely) and
  accepts amounts as numbers or quoted decimals.
*/
settleup::ledger::v1::ExpenseList ParseExpenseList(const std::string& json);
settleup::ledger::v1::Expense     ParseExpense(const std::string& json);

std::string ToJson(const google::protobuf::Message& message, bool pretty = false);

} // namespace settleup::codec
