#pragma once

#include <string>
#include <vector>

#include "internal/util/uuid.hpp"

namespace claimstone::quota {

/*
  Host permission system. Grants are opaque strings; only the limit shapes
  are interpreted by QuotaResolver.
*/
class PermissionSource {
 public:
  virtual ~PermissionSource() = default;

  virtual std::vector<std::string> EffectiveGrants(const util::UUID& principal) = 0;
};

} // namespace claimstone::quota
