#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace settleup::model {

enum class Role : std::uint8_t {
  kPayer = 1,
  kOwer  = 2,
};

enum class PaymentStatus : std::uint8_t {
  kPending   = 1,
  kSent      = 2,
  kCompleted = 3,
};

/*
  Wire spellings used by the persistence API.
*/
std::string_view ToString(Role role);
std::string_view ToString(PaymentStatus status);

std::optional<Role>          ParseRole(std::string_view value);
std::optional<PaymentStatus> ParsePaymentStatus(std::string_view value);

} // namespace settleup::model
