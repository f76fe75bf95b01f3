#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include "internal/codec/expense_codec.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/ledger/expense_ledger.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/split/split_state.hpp"

namespace {

using settleup::model::Role;
using settleup::split::Finalize;
using settleup::split::SplitState;

void Print(const SplitState& state) {
  for (const auto& id : state.Selected()) {
    std::cout << "  " << id << ": " << std::fixed << std::setprecision(2) << state.Percentage(id) << "%"
              << (state.IsEffectivelyLocked(id) ? " (locked)" : "") << '\n';
  }
}

} // namespace

int main() {
  constexpr double kTotal = 87.40;

  // Alice paid the whole bill.
  auto payers = Finalize(SplitState(Role::kPayer).Select("alice"), kTotal);

  // Three owers; Bob had the expensive dish and locks his share in.
  auto owers = SplitState(Role::kOwer).Select("alice").Select("bob").Select("carol");
  owers      = owers.SetPercentage("bob", 50.0).ToggleLock("bob");
  owers      = owers.SetPercentage("carol", 20.0);
  std::cout << "owers:\n";
  Print(owers);

  auto split = Finalize(owers, kTotal);
  if (!split.committed()) {
    // Rescaled split; a UI would show it before asking again.
    std::cout << "rescaled:\n";
    Print(split.state);
    split = Finalize(split.state, kTotal);
  }

  settleup::ledger::ExpenseDraft draft;
  draft.description  = "Dinner";
  draft.total_amount = kTotal;
  draft.created_by   = "alice";
  draft.participants = payers.participants;
  draft.participants.insert(draft.participants.end(), split.participants.begin(), split.participants.end());

  auto store = std::make_shared<settleup::db::memory::MemoryStore>();

  try {
    settleup::service::LedgerService ledger({"friends", std::nullopt}, store);
    auto                             submitted = ledger.CreateExpense(draft);
    submitted.persisted.get();

    std::cout << settleup::codec::ToJson(settleup::codec::ToProto(submitted.expense), true) << '\n';
    for (const auto& transfer : ledger.GroupSettlement()) {
      std::cout << transfer.from << " -> " << transfer.to << ": " << transfer.amount << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "split example failed: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
