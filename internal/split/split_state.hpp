#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/model/expense.hpp"
#include "internal/model/types.hpp"

namespace settleup::split {

/*
  Percentage split of one role (payers or owers) of an expense.

  SplitState is a value: every transition returns a new state and leaves
  the receiver untouched, so an editor can keep history or compare states
  freely.

  Percentages are in [0, 100]. Locked members keep their share when
  another member's share is edited; the unlocked rest absorb the
  difference evenly.
*/
class SplitState {
 public:
  explicit SplitState(model::Role role);

  // Rebuilds percentages from stored amounts, for editing an existing expense.
  static SplitState FromParticipants(model::Role role, const std::vector<model::Participant>& participants, double total_amount);

  model::Role                     role() const { return role_; }
  const std::vector<std::string>& Selected() const { return selected_; }

  bool   IsSelected(const std::string& member_id) const;
  bool   IsLocked(const std::string& member_id) const;
  double Percentage(const std::string& member_id) const;
  double Sum() const;

  // True when member_id is the only selected member without a lock.
  bool IsLastUnlocked(const std::string& member_id) const;
  bool IsEffectivelyLocked(const std::string& member_id) const;

  // Upper bound SetPercentage will accept for member_id.
  double MaxPercentage(const std::string& member_id) const;

  /*
    Toggle selection.

    Adding resets the whole selection to an equal split, whatever was
    locked before. Removing only drops that member's share and lock; the
    remaining shares are left as they are until the next edit. Removing the
    only unlocked member leaves every remaining member locked, and
    SetPercentage then redistributes nothing until a lock is released.
  */
  SplitState Select(const std::string& member_id) const;

  SplitState SetPercentage(const std::string& member_id, double value) const;

  // Every share scaled by 100 / Sum(). Locks are kept.
  SplitState Normalized() const;

  // No-op when member_id is the last unlocked member.
  SplitState ToggleLock(const std::string& member_id) const;

  bool operator==(const SplitState&) const = default;

 private:
  model::Role                             role_;
  std::vector<std::string>                selected_;
  std::unordered_map<std::string, double> percentages_;
  std::unordered_set<std::string>         locked_;
};

struct FinalizeResult {
  enum class Outcome {
    kCommitted,
    // Percentages were rescaled to 100; show them and finalize again.
    kNeedsConfirmation,
  };

  Outcome                         outcome;
  SplitState                      state;
  std::vector<model::Participant> participants;

  bool committed() const { return outcome == Outcome::kCommitted; }
};

/*
  Turns percentages into amounts of total_amount.

  A split more than 0.1 away from 100 is never committed directly: it is
  rescaled and handed back for confirmation. Committed amounts are
  rounded to cents and sum to total_amount within 0.01.

  Emitted rows carry PaymentStatus::kPending; the ledger applies the
  initial status policy.
*/
FinalizeResult Finalize(const SplitState& state, double total_amount);

} // namespace settleup::split
