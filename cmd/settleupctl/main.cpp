#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/codec/expense_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/directory/member_directory.hpp"
#include "internal/ledger/expense_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/settlement/settlement_tracker.hpp"
#include "settleup/ledger/v1.hpp"

using namespace settleup::ledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  settleupctl [options] <expenses.json> balance <user_id>\n"
            << "  settleupctl [options] <expenses.json> simplify [user_id]\n"
            << "  settleupctl [options] <expenses.json> summary <user_id>\n"
            << "  settleupctl [options] <expenses.json> status <expense_id>\n"
            << "\n"
            << "Options:\n"
            << "  --config <config.yaml>   logging and ledger settings\n"
            << "  --group <group_id>       scope (default: group of the first expense)\n"
            << "  --event <event_id>       narrow the scope to one event\n"
            << "  --pretty                 indent JSON output\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Flushes and drops the loggers on every way out of main.
struct LoggingShutdown {
  ~LoggingShutdown() {
    settleup::observability::ShutdownLogging();
  }
};

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::optional<std::string> group_id;
  std::optional<std::string> event_id;
  bool                       pretty = false;
  std::vector<std::string>   args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--config" || arg == "--group" || arg == "--event") && i + 1 < argc) {
      std::string value = argv[++i];
      if (arg == "--config") config_path = value;
      if (arg == "--group") group_id = value;
      if (arg == "--event") event_id = value;
    } else if (arg == "--pretty") {
      pretty = true;
    } else if (arg == "--help" || arg == "-h") {
      Usage();
      return 0;
    } else {
      args.push_back(arg);
    }
  }

  if (args.size() < 2) {
    Usage();
    return 1;
  }

  const std::string& data_path = args[0];
  const std::string& cmd       = args[1];

  LoggingShutdown logging_shutdown;
  try {
    settleup::runtime::config::RuntimeConfig config;
    if (config_path) {
      config = settleup::config::ConfigLoader::LoadFromYaml(*config_path);
    } else {
      settleup::config::ConfigLoader::ApplyDefaults(config);
    }
    settleup::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Load expenses into a store scoped like the app would see them
    // ------------------------------------------------------------
    const auto list     = settleup::codec::ParseExpenseList(ReadFile(data_path));
    const auto expenses = settleup::codec::DecodeExpenses(list);

    settleup::directory::MemberDirectory members(config.directory().fallback_prefix());
    members.PutAll(settleup::codec::DecodeMembers(list));

    if (!group_id) {
      if (expenses.empty()) {
        std::cerr << "--group is required when the file has no expenses\n";
        return 1;
      }
      group_id = expenses.front().group_id;
    }

    auto store = std::make_shared<settleup::db::memory::MemoryStore>();
    for (const auto& expense : expenses) {
      settleup::db::ThrowIfError(store->Insert(expense), "load expense " + expense.id);
    }

    settleup::ledger::LedgerOptions ledger_options;
    ledger_options.default_description = config.ledger().default_description();

    settleup::service::LedgerService ledger({*group_id, event_id}, store, settleup::ledger::ExpenseLedger(ledger_options),
                                            config.ledger().settle_threshold());
    ledger.Refresh();

    SETTLEUP_LOG_DEBUG("Expenses loaded", {settleup::observability::StringField("group_id", *group_id),
                                           settleup::observability::IntField("count", static_cast<int64_t>(ledger.Expenses().size()))});

    // ------------------------------------------------------------

    if (cmd == "balance") {
      if (args.size() < 3) {
        Usage();
        return 1;
      }
      const auto& user = args[2];
      std::cout << settleup::codec::ToJson(settleup::codec::ToProto(user, ledger.Balance(user), &members), pretty) << "\n";
      return 0;
    }

    if (cmd == "simplify") {
      const auto transfers = args.size() >= 3 ? ledger.SettlementFor(args[2]) : ledger.GroupSettlement();

      SimplifiedDebts out;
      for (const auto& transfer : transfers) {
        *out.add_transfers() = settleup::codec::ToProto(transfer, &members);
      }
      std::cout << settleup::codec::ToJson(out, pretty) << "\n";
      return 0;
    }

    if (cmd == "summary") {
      if (args.size() < 3) {
        Usage();
        return 1;
      }
      const auto summary = ledger.Summary(args[2]);

      ExpenseSummary out;
      out.set_expense_count(static_cast<uint32_t>(summary.expense_count));
      out.set_total_amount(summary.total_amount);
      out.set_active_expense_count(static_cast<uint32_t>(summary.active_expense_count));
      out.set_active_total_amount(summary.active_total_amount);
      out.set_user_owes(summary.user_owes);
      out.set_events_with_expenses(static_cast<uint32_t>(summary.events_with_expenses));
      std::cout << settleup::codec::ToJson(out, pretty) << "\n";
      return 0;
    }

    if (cmd == "status") {
      if (args.size() < 3) {
        Usage();
        return 1;
      }
      auto expense = ledger.Find(args[2]);
      if (!expense) {
        std::cerr << "expense not found: " << args[2] << "\n";
        return 2;
      }

      ExpenseStatus out;
      out.set_expense_id(expense->id);
      out.set_fully_settled(settleup::settlement::SettlementTracker::IsFullySettled(*expense));
      out.set_overall_status(std::string(settleup::settlement::ToString(settleup::settlement::SettlementTracker::Overall(*expense))));
      std::cout << settleup::codec::ToJson(out, pretty) << "\n";
      return 0;
    }

    std::cerr << "unknown command: " << cmd << "\n";
    Usage();
    return 1;
  } catch (const std::exception& e) {
    SETTLEUP_LOG_ERROR("Fatal error", {settleup::observability::StringField("error", e.what())});
    return 2;
  }
}
