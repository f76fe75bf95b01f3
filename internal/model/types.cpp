#include "internal/model/types.hpp"

namespace settleup::model {

std::string_view ToString(Role role) {
  switch (role) {
    case Role::kPayer:
      return "payer";
    case Role::kOwer:
      return "ower";
  }
  return "unknown";
}

std::string_view ToString(PaymentStatus status) {
  switch (status) {
    case PaymentStatus::kPending:
      return "pending";
    case PaymentStatus::kSent:
      return "sent";
    case PaymentStatus::kCompleted:
      return "completed";
  }
  return "unknown";
}

std::optional<Role> ParseRole(std::string_view value) {
  if (value == "payer") {
    return Role::kPayer;
  }
  if (value == "ower") {
    return Role::kOwer;
  }
  return std::nullopt;
}

std::optional<PaymentStatus> ParsePaymentStatus(std::string_view value) {
  if (value == "pending") {
    return PaymentStatus::kPending;
  }
  if (value == "sent") {
    return PaymentStatus::kSent;
  }
  if (value == "completed") {
    return PaymentStatus::kCompleted;
  }
  return std::nullopt;
}

} // namespace settleup::model
