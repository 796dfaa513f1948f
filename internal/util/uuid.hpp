#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace claimstone::util {

/*
  UUID helpers

  Principals are identified by raw 16 byte RFC4122 UUIDs. The canonical text
  form is 8-4-4-4-12 lowercase hex digits.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Strict parse of the canonical 36 character form (either letter case).
std::optional<UUID> TryParse(std::string_view str);

} // namespace claimstone::util
