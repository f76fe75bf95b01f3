#include "uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace settleup::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (std::size_t i = 0; i < id.size(); i += 8) {
    auto bits = rng();
    for (std::size_t j = 0; j < 8; ++j, bits >>= 8) {
      id[i + j] = static_cast<uint8_t>(bits & 0xFFu);
    }
  }

  // version 4, RFC4122 variant
  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);
  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out << '-';
    out << std::setw(2) << static_cast<int>(id[i]);
  }
  return out.str();
}

std::string NewExpenseId() {
  return ToString(GenerateUUID());
}

} // namespace settleup::util
