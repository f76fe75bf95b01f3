#include "internal/codec/expense_codec.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "internal/model/money.hpp"
#include "internal/util/errors.hpp"

namespace {

using settleup::model::NearlyEqual;
using settleup::model::PaymentStatus;
using settleup::model::Role;

constexpr const char* kExpenseListJson = R"({
  "expenses": [
    {
      "id": "11111111-2222-4333-8444-555555555555",
      "group_id": "group-1",
      "event_id": "beach-trip",
      "description": "Groceries",
      "total_amount": "42.50",
      "created_by": "device-a1b2",
      "created_at": "2024-05-01T10:00:00Z",
      "updated_at": "2024-05-01T10:05:00Z",
      "participants": [
        {"member_id": "device-a1b2", "role": "payer", "individual_amount": 42.5, "payment_status": "completed"},
        {"member_id": "device-c3d4", "role": "ower", "individual_amount": "21.25", "payment_status": "sent"},
        {"member_id": "device-e5f6", "role": "ower", "individual_amount": "21.25"}
      ],
      "receipt_url": "ignored by the codec"
    }
  ],
  "members": [
    {"member_id": "device-a1b2", "display_name": "Alice"},
    {"member_id": "device-c3d4"}
  ]
})";

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const settleup::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestDecodesStringAndNumericAmounts() {
  auto list     = settleup::codec::ParseExpenseList(kExpenseListJson);
  auto expenses = settleup::codec::DecodeExpenses(list);

  assert(expenses.size() == 1);
  const auto& expense = expenses[0];
  assert(expense.event_id == std::optional<std::string>("beach-trip"));
  assert(NearlyEqual(expense.total_amount, 42.5, 1e-9));
  assert(expense.participants.size() == 3);
  assert(expense.participants[0].role == Role::kPayer);
  assert(NearlyEqual(expense.participants[1].individual_amount, 21.25, 1e-9));
  assert(expense.participants[1].payment_status == PaymentStatus::kSent);
  // Missing status reads as pending.
  assert(expense.participants[2].payment_status == PaymentStatus::kPending);
  assert(expense.updated_at > expense.created_at);
}

void TestDecodesMembers() {
  auto members = settleup::codec::DecodeMembers(settleup::codec::ParseExpenseList(kExpenseListJson));

  assert(members.size() == 2);
  assert(members[0].display_name == "Alice");
  assert(members[1].display_name.empty());
}

void TestRejectsUnknownRoleAndStatus() {
  auto bad_role = settleup::codec::ParseExpenseList(kExpenseListJson);
  bad_role.mutable_expenses(0)->mutable_participants(1)->set_role("lender");
  assert(ThrowsInvalidArgument([&] { (void)settleup::codec::DecodeExpenses(bad_role); }));

  auto bad_status = settleup::codec::ParseExpenseList(kExpenseListJson);
  bad_status.mutable_expenses(0)->mutable_participants(1)->set_payment_status("refunded");
  assert(ThrowsInvalidArgument([&] { (void)settleup::codec::DecodeExpenses(bad_status); }));
}

void TestRejectsExpensesBreakingInvariants() {
  auto unbalanced = settleup::codec::ParseExpenseList(kExpenseListJson);
  unbalanced.mutable_expenses(0)->mutable_participants(2)->set_individual_amount(5.0);

  std::string message;
  try {
    (void)settleup::codec::DecodeExpenses(unbalanced);
  } catch (const settleup::util::InvalidArgument& e) {
    message = e.what();
  }
  assert(message.find("11111111-2222-4333-8444-555555555555") != std::string::npos);

  auto no_id = settleup::codec::ParseExpenseList(kExpenseListJson);
  no_id.mutable_expenses(0)->clear_id();
  assert(ThrowsInvalidArgument([&] { (void)settleup::codec::DecodeExpenses(no_id); }));
}

void TestRejectsMalformedJson() {
  assert(ThrowsInvalidArgument([] { (void)settleup::codec::ParseExpenseList("{\"expenses\": [}"); }));
  assert(ThrowsInvalidArgument([] { (void)settleup::codec::ParseExpense("{\"total_amount\": \"twelve\"}"); }));
}

void TestEncodesRoleAndStatusAsWireStrings() {
  auto expense = settleup::codec::DecodeExpenses(settleup::codec::ParseExpenseList(kExpenseListJson)).front();
  auto proto   = settleup::codec::ToProto(expense);

  assert(proto.participants(0).role() == "payer");
  assert(proto.participants(1).payment_status() == "sent");
  assert(proto.event_id() == "beach-trip");

  auto decoded = settleup::codec::FromProto(proto);
  assert(decoded == expense);

  const auto json = settleup::codec::ToJson(proto);
  assert(json.find("\"total_amount\":42.5") != std::string::npos);
  assert(json.find("\"created_at\":\"2024-05-01T10:00:00Z\"") != std::string::npos);
}

void TestTransferDisplayNames() {
  settleup::directory::MemberDirectory members;
  members.Put({"device-a1b2", "Alice"});

  settleup::settlement::Transfer transfer{"device-c3d4", "device-a1b2", 21.25};

  auto bare = settleup::codec::ToProto(transfer);
  assert(bare.from_display_name().empty());

  auto named = settleup::codec::ToProto(transfer, &members);
  assert(named.from() == "device-c3d4");
  assert(named.from_display_name() == "User c3d4");
  assert(named.to_display_name() == "Alice");
}

void TestBalanceEncoding() {
  settleup::balance::UserBalance user_balance;
  user_balance.total_owing    = 21.25;
  user_balance.net_balance    = -21.25;
  user_balance.detailed_debts = {{"e1", "Groceries", "device-a1b2", 21.25}};

  settleup::directory::MemberDirectory members;
  members.Put({"device-a1b2", "Alice"});

  auto proto = settleup::codec::ToProto("device-c3d4", user_balance, &members);
  assert(proto.user_id() == "device-c3d4");
  assert(proto.detailed_debts_size() == 1);
  assert(proto.detailed_debts(0).counterparty_display_name() == "Alice");
  assert(proto.detailed_credits_size() == 0);

  const auto json = settleup::codec::ToJson(proto);
  assert(json.find("\"total_owed\":0") != std::string::npos);
}

} // namespace

int main() {
  TestDecodesStringAndNumericAmounts();
  TestDecodesMembers();
  TestRejectsUnknownRoleAndStatus();
  TestRejectsExpensesBreakingInvariants();
  TestRejectsMalformedJson();
  TestEncodesRoleAndStatusAsWireStrings();
  TestTransferDisplayNames();
  TestBalanceEncoding();

  std::cout << "settleup_unit_codec: pass\n";
  return 0;
}
