#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/types.hpp"
#include "internal/util/time.hpp"

namespace settleup::model {

/*
  Read-only view of a group member. Owned by the membership service;
  the ledger only refers to members by id.
*/
struct Member {
  std::string member_id;
  std::string display_name;
};

struct Participant {
  std::string   member_id;
  Role          role              = Role::kOwer;
  double        individual_amount = 0.0;
  PaymentStatus payment_status    = PaymentStatus::kPending;

  bool operator==(const Participant&) const = default;
};

/*
  Expense row plus its full participant set.

  Participants are replaced as a whole on edit; only payment_status is
  mutated in place after creation.
*/
struct Expense {
  std::string                id;
  std::string                group_id;
  std::optional<std::string> event_id;
  std::string                description;
  double                     total_amount = 0.0;
  std::string                created_by;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  std::vector<Participant> participants;

  bool operator==(const Expense&) const = default;
};

/*
  Address of an expense collection: a group, optionally narrowed to one
  event of that group.
*/
struct Scope {
  std::string                group_id;
  std::optional<std::string> event_id;

  bool Contains(const Expense& expense) const {
    if (expense.group_id != group_id) {
      return false;
    }
    return !event_id.has_value() || expense.event_id == event_id;
  }
};

double SumAmounts(const Expense& expense, Role role);

// Rows of the given member and role, or nullptr.
Participant*       FindParticipant(Expense& expense, const std::string& member_id, Role role);
const Participant* FindParticipant(const Expense& expense, const std::string& member_id, Role role);

} // namespace settleup::model
