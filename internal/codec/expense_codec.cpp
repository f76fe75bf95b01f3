#include "internal/codec/expense_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <stdexcept>

#include "internal/ledger/expense_ledger.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace settleup::codec {

namespace v1 = settleup::ledger::v1;

namespace {

double CheckedAmount(double value, const std::string& what) {
  if (!std::isfinite(value)) {
    throw util::InvalidArgument("non-finite amount for " + what);
  }
  return value;
}

template <typename Message>
Message ParseJson(const std::string& json, const char* what) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw util::InvalidArgument(std::string("invalid ") + what + ": " + std::string(status.message()));
  }
  return message;
}

} // namespace

model::Participant FromProto(const v1::Participant& proto) {
  model::Participant participant;
  participant.member_id = proto.member_id();

  auto role = model::ParseRole(proto.role());
  if (!role) {
    throw util::InvalidArgument("unknown participant role '" + proto.role() + "'");
  }
  participant.role = *role;

  // Rows written before statuses existed carry none; treat them as pending.
  if (proto.payment_status().empty()) {
    participant.payment_status = model::PaymentStatus::kPending;
  } else {
    auto status = model::ParsePaymentStatus(proto.payment_status());
    if (!status) {
      throw util::InvalidArgument("unknown payment status '" + proto.payment_status() + "'");
    }
    participant.payment_status = *status;
  }

  participant.individual_amount = CheckedAmount(proto.individual_amount(), proto.member_id());
  return participant;
}

model::Expense FromProto(const v1::Expense& proto) {
  model::Expense expense;
  expense.id       = proto.id();
  expense.group_id = proto.group_id();
  if (!proto.event_id().empty()) {
    expense.event_id = proto.event_id();
  }
  expense.description  = proto.description();
  expense.total_amount = CheckedAmount(proto.total_amount(), "expense " + proto.id());
  expense.created_by   = proto.created_by();
  expense.created_at   = util::FromProto(proto.created_at());
  expense.updated_at   = util::FromProto(proto.updated_at());

  expense.participants.reserve(proto.participants_size());
  for (const auto& participant : proto.participants()) {
    expense.participants.push_back(FromProto(participant));
  }

  if (expense.id.empty()) {
    throw util::InvalidArgument("expense without id");
  }
  try {
    ledger::ExpenseLedger::Validate(expense);
  } catch (const util::InvalidArgument& e) {
    throw util::InvalidArgument("expense " + expense.id + ": " + e.what());
  }
  return expense;
}

model::Member FromProto(const v1::Member& proto) {
  if (proto.member_id().empty()) {
    throw util::InvalidArgument("member without id");
  }
  return {proto.member_id(), proto.display_name()};
}

v1::Participant ToProto(const model::Participant& participant) {
  v1::Participant proto;
  proto.set_member_id(participant.member_id);
  proto.set_role(std::string(model::ToString(participant.role)));
  proto.set_individual_amount(participant.individual_amount);
  proto.set_payment_status(std::string(model::ToString(participant.payment_status)));
  return proto;
}

v1::Expense ToProto(const model::Expense& expense) {
  v1::Expense proto;
  proto.set_id(expense.id);
  proto.set_group_id(expense.group_id);
  if (expense.event_id) {
    proto.set_event_id(*expense.event_id);
  }
  proto.set_description(expense.description);
  proto.set_total_amount(expense.total_amount);
  proto.set_created_by(expense.created_by);
  *proto.mutable_created_at() = util::ToProto(expense.created_at);
  *proto.mutable_updated_at() = util::ToProto(expense.updated_at);
  for (const auto& participant : expense.participants) {
    *proto.add_participants() = ToProto(participant);
  }
  return proto;
}

v1::UserBalance ToProto(const std::string& user_id, const balance::UserBalance& user_balance, const directory::MemberDirectory* members) {
  v1::UserBalance proto;
  proto.set_user_id(user_id);
  proto.set_net_balance(user_balance.net_balance);
  proto.set_total_owed(user_balance.total_owed);
  proto.set_total_owing(user_balance.total_owing);

  auto fill = [members](const balance::DebtDetail& detail, v1::DebtDetail* out) {
    out->set_expense_id(detail.expense_id);
    out->set_expense_name(detail.expense_name);
    out->set_counterparty(detail.counterparty);
    out->set_amount(detail.amount);
    if (members != nullptr) {
      out->set_counterparty_display_name(members->DisplayName(detail.counterparty));
    }
  };
  for (const auto& debt : user_balance.detailed_debts) {
    fill(debt, proto.add_detailed_debts());
  }
  for (const auto& credit : user_balance.detailed_credits) {
    fill(credit, proto.add_detailed_credits());
  }
  return proto;
}

v1::Transfer ToProto(const settlement::Transfer& transfer, const directory::MemberDirectory* members) {
  v1::Transfer proto;
  proto.set_from(transfer.from);
  proto.set_to(transfer.to);
  proto.set_amount(transfer.amount);
  if (members != nullptr) {
    proto.set_from_display_name(members->DisplayName(transfer.from));
    proto.set_to_display_name(members->DisplayName(transfer.to));
  }
  return proto;
}

std::vector<model::Expense> DecodeExpenses(const v1::ExpenseList& list) {
  std::vector<model::Expense> expenses;
  expenses.reserve(list.expenses_size());
  for (const auto& expense : list.expenses()) {
    expenses.push_back(FromProto(expense));
  }
  return expenses;
}

std::vector<model::Member> DecodeMembers(const v1::ExpenseList& list) {
  std::vector<model::Member> members;
  members.reserve(list.members_size());
  for (const auto& member : list.members()) {
    members.push_back(FromProto(member));
  }
  return members;
}

v1::ExpenseList ParseExpenseList(const std::string& json) {
  return ParseJson<v1::ExpenseList>(json, "expense list");
}

v1::Expense ParseExpense(const std::string& json) {
  return ParseJson<v1::Expense>(json, "expense");
}

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = pretty;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize message to JSON: " + std::string(status.message()));
  }
  return json;
}

} // namespace settleup::codec
