#include "internal/split/split_state.hpp"

#include <algorithm>
#include <cmath>

#include "internal/model/money.hpp"
#include "internal/util/errors.hpp"

namespace settleup::split {

namespace {

double LockedSumExcluding(const std::unordered_set<std::string>&         locked,
                          const std::unordered_map<std::string, double>& percentages,
                          const std::string&                             member_id) {
  double sum = 0.0;
  for (const auto& id : locked) {
    if (id == member_id) {
      continue;
    }
    auto it = percentages.find(id);
    if (it != percentages.end()) {
      sum += it->second;
    }
  }
  return sum;
}

void RequireSelected(const SplitState& state, const std::string& member_id) {
  if (!state.IsSelected(member_id)) {
    throw util::InvalidArgument("member " + member_id + " is not part of the " + std::string(model::ToString(state.role())) + " split");
  }
}

// Spreads the rounding residual over members in selection order: every row
// takes an equal number of cents and the first rows take one more for the
// remainder. Cents taken back never push a row below zero.
void ReconcileCents(std::vector<model::Participant>& rows, double total_amount) {
  if (rows.empty()) {
    return;
  }

  double sum = 0.0;
  for (const auto& row : rows) {
    sum += row.individual_amount;
  }
  if (model::NearlyEqual(sum, total_amount)) {
    return;
  }

  // Whole cents held in a double; exact well past any realistic total.
  double cents = std::round((total_amount - sum) * 100.0);
  if (cents > 0.0) {
    const double count = static_cast<double>(rows.size());
    const double base  = std::floor(cents / count);
    double       extra = cents - base * count;
    for (auto& row : rows) {
      double add = base;
      if (extra > 0.0) {
        add += 1.0;
        extra -= 1.0;
      }
      row.individual_amount = model::Round2(row.individual_amount + add / 100.0);
    }
    return;
  }

  cents = -cents;
  while (cents > 0.0) {
    std::vector<model::Participant*> payable;
    for (auto& row : rows) {
      if (row.individual_amount >= 0.01) {
        payable.push_back(&row);
      }
    }
    if (payable.empty()) {
      return;
    }

    const double count = static_cast<double>(payable.size());
    const double base  = std::floor(cents / count);
    double       extra = cents - base * count;
    for (auto* row : payable) {
      double take = base;
      if (extra > 0.0) {
        take += 1.0;
        extra -= 1.0;
      }
      take = std::min(take, std::round(row->individual_amount * 100.0));
      row->individual_amount = model::Round2(row->individual_amount - take / 100.0);
      cents -= take;
    }
  }
}

} // namespace

SplitState::SplitState(model::Role role) : role_(role) {
}

SplitState SplitState::FromParticipants(model::Role role, const std::vector<model::Participant>& participants, double total_amount) {
  if (total_amount <= 0.0) {
    throw util::InvalidArgument("total amount must be positive");
  }

  SplitState state(role);
  for (const auto& participant : participants) {
    if (participant.role != role || state.IsSelected(participant.member_id)) {
      continue;
    }
    state.selected_.push_back(participant.member_id);
    state.percentages_[participant.member_id] = participant.individual_amount / total_amount * 100.0;
  }
  return state;
}

bool SplitState::IsSelected(const std::string& member_id) const {
  return std::find(selected_.begin(), selected_.end(), member_id) != selected_.end();
}

bool SplitState::IsLocked(const std::string& member_id) const {
  return locked_.count(member_id) > 0;
}

double SplitState::Percentage(const std::string& member_id) const {
  auto it = percentages_.find(member_id);
  return it == percentages_.end() ? 0.0 : it->second;
}

double SplitState::Sum() const {
  double sum = 0.0;
  for (const auto& id : selected_) {
    sum += Percentage(id);
  }
  return sum;
}

bool SplitState::IsLastUnlocked(const std::string& member_id) const {
  std::size_t unlocked = 0;
  bool        target   = false;
  for (const auto& id : selected_) {
    if (IsLocked(id)) {
      continue;
    }
    ++unlocked;
    target = target || id == member_id;
  }
  return unlocked == 1 && target;
}

bool SplitState::IsEffectivelyLocked(const std::string& member_id) const {
  return IsLocked(member_id) || IsLastUnlocked(member_id);
}

double SplitState::MaxPercentage(const std::string& member_id) const {
  return std::max(0.0, 100.0 - LockedSumExcluding(locked_, percentages_, member_id));
}

SplitState SplitState::Select(const std::string& member_id) const {
  SplitState next = *this;

  auto it = std::find(next.selected_.begin(), next.selected_.end(), member_id);
  if (it != next.selected_.end()) {
    next.selected_.erase(it);
    next.percentages_.erase(member_id);
    next.locked_.erase(member_id);
    return next;
  }

  next.selected_.push_back(member_id);
  const double equal = 100.0 / static_cast<double>(next.selected_.size());
  next.percentages_.clear();
  for (const auto& id : next.selected_) {
    next.percentages_[id] = equal;
  }
  return next;
}

SplitState SplitState::SetPercentage(const std::string& member_id, double value) const {
  RequireSelected(*this, member_id);
  if (!std::isfinite(value)) {
    throw util::InvalidArgument("percentage must be a finite number");
  }

  SplitState next = *this;

  const double locked_sum = LockedSumExcluding(locked_, percentages_, member_id);
  const double max_value  = std::max(0.0, 100.0 - locked_sum);
  const double clamped    = std::clamp(value, 0.0, max_value);
  next.percentages_[member_id] = clamped;

  std::vector<std::string> absorbers;
  for (const auto& id : selected_) {
    if (id != member_id && !IsLocked(id)) {
      absorbers.push_back(id);
    }
  }

  // With nobody left to absorb it, the remainder stays unassigned and
  // Finalize will ask for confirmation.
  if (absorbers.empty()) {
    return next;
  }

  const double available = std::max(0.0, 100.0 - locked_sum - clamped);
  const double share     = available / static_cast<double>(absorbers.size());
  for (const auto& id : absorbers) {
    next.percentages_[id] = share;
  }
  return next;
}

SplitState SplitState::Normalized() const {
  const double sum = Sum();
  if (!(sum > 0.0)) {
    throw util::InvalidArgument("cannot normalize an empty split");
  }

  SplitState   next   = *this;
  const double factor = 100.0 / sum;
  for (const auto& id : selected_) {
    next.percentages_[id] = Percentage(id) * factor;
  }
  return next;
}

SplitState SplitState::ToggleLock(const std::string& member_id) const {
  RequireSelected(*this, member_id);
  if (IsLastUnlocked(member_id)) {
    return *this;
  }

  SplitState next = *this;
  if (next.locked_.erase(member_id) == 0) {
    next.locked_.insert(member_id);
  }
  return next;
}

FinalizeResult Finalize(const SplitState& state, double total_amount) {
  if (!(total_amount > 0.0) || !std::isfinite(total_amount)) {
    throw util::InvalidArgument("total amount must be positive");
  }
  if (state.Selected().empty()) {
    throw util::InvalidArgument("select at least one " + std::string(model::ToString(state.role())));
  }

  const double sum = state.Sum();
  if (!(sum > 0.0)) {
    throw util::InvalidArgument("the " + std::string(model::ToString(state.role())) + " split has no share assigned");
  }

  if (std::fabs(sum - 100.0) > model::kPercentTolerance) {
    return {FinalizeResult::Outcome::kNeedsConfirmation, state.Normalized(), {}};
  }

  std::vector<model::Participant> rows;
  rows.reserve(state.Selected().size());
  for (const auto& id : state.Selected()) {
    model::Participant row;
    row.member_id         = id;
    row.role              = state.role();
    row.individual_amount = model::Round2(total_amount * state.Percentage(id) / 100.0);
    row.payment_status    = model::PaymentStatus::kPending;
    rows.push_back(std::move(row));
  }
  ReconcileCents(rows, total_amount);

  return {FinalizeResult::Outcome::kCommitted, state, std::move(rows)};
}

} // namespace settleup::split
