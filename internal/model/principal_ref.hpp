#pragma once

#include <string>
#include <variant>

#include "internal/util/uuid.hpp"

namespace claimstone::model {

/*
  Reference to a principal (player) in a region's owner or member list.

  Legacy regions stored display names; current regions store UUIDs. Both
  forms coexist until the identifier migration has run.
*/

struct ById {
  util::UUID id{};

  bool operator==(const ById&) const = default;
};

struct ByName {
  std::string name;

  bool operator==(const ByName&) const = default;
};

using PrincipalRef = std::variant<ById, ByName>;

// Canonical UUID text parses to ById, anything else to ByName.
PrincipalRef ParsePrincipal(const std::string& raw);

// Inverse of ParsePrincipal: lowercase UUID text or the display name.
std::string FormatPrincipal(const PrincipalRef& ref);

inline bool IsLegacy(const PrincipalRef& ref) {
  return std::holds_alternative<ByName>(ref);
}

} // namespace claimstone::model
