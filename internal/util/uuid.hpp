#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace settleup::util {

/*
  UUID helpers

  Expense ids are random RFC4122 version 4 UUIDs in canonical text form,
  matching what the persistence API generates server side.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string NewExpenseId();

} // namespace settleup::util
