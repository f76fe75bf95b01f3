#pragma once

#include <cstdint>

#include "internal/model/types.hpp"

namespace settleup::model {

constexpr bool IsTerminal(PaymentStatus status) {
  return status == PaymentStatus::kCompleted;
}

/*
  pending -> sent -> completed, never backwards.

  Re-applying the current status is allowed so that retried updates are
  idempotent. Skipping "sent" is allowed: a payer can confirm receipt
  without the ower having marked the payment as sent.
*/
constexpr bool CanTransition(PaymentStatus from, PaymentStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }

  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

} // namespace settleup::model
