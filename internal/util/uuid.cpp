#include "uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace claimstone::util {

namespace {

constexpr std::size_t kCanonicalLength = 36;

bool IsDashPosition(std::size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i==4||i==6||i==8||i==10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(id[i]);
  }
  return oss.str();
}

UUID FromString(const std::string& str) {
  auto parsed = TryParse(str);
  if (!parsed)
    throw std::runtime_error("Invalid UUID string: " + str);
  return *parsed;
}

std::optional<UUID> TryParse(std::string_view str) {
  if (str.size() != kCanonicalLength)
    return std::nullopt;

  UUID id{};
  std::size_t byte = 0;
  for (std::size_t i = 0; i < str.size();) {
    if (IsDashPosition(i)) {
      if (str[i] != '-') return std::nullopt;
      ++i;
      continue;
    }

    const int hi = HexValue(str[i]);
    const int lo = HexValue(str[i + 1]);
    if (hi < 0 || lo < 0 || IsDashPosition(i + 1))
      return std::nullopt;

    id[byte++] = static_cast<uint8_t>((hi << 4) | lo);
    i += 2;
  }

  return id;
}

} // namespace claimstone::util
