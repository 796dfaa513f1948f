#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/principal_ref.hpp"

namespace claimstone::model {

/*
  Authoritative region row.

  IMPORTANT:
  - The store owns this record; the index only reflects it.
  - block_type is set only for regions created by a protect block. Other
    regions may share the store but are never indexed or resolved.
*/

struct RegionRecord {
  std::string id;
  std::string world;

  std::optional<std::string> alias;
  std::optional<std::string> block_type;

  std::vector<PrincipalRef> owners;
  std::vector<PrincipalRef> members;

  bool operator==(const RegionRecord&) const = default;
};

inline constexpr const char* kRegionIdPrefix = "ps";

inline bool IsProtectedRegion(const RegionRecord& r) {
  return r.id.starts_with(kRegionIdPrefix) && r.block_type.has_value();
}

} // namespace claimstone::model
