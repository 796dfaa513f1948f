#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/catalog/block_catalog.hpp"

namespace claimstone::quota {

// No explicit cap was granted. Callers treat this as unbounded, not zero.
inline constexpr int kNoLimit = -1;

struct QuotaRecord {
  // keyed by ProtectBlock::type; blocks without a grant are absent
  std::unordered_map<std::string, int> per_block;
  int                                  global = kNoLimit;
};

/*
  Derives region limits from permission grants.

    <ns>.limit.<alias-or-type>.<n>   limit for one protect block
    <ns>.limit.<n>                   limit across all blocks

  Grants of any other shape, for unknown blocks, or with a non-integer
  count are skipped one by one. Several grants for the same target resolve
  to the largest value. The namespace must not contain '.'.
*/
class QuotaResolver {
 public:
  explicit QuotaResolver(std::string permission_namespace = "protectionstones");

  std::unordered_map<std::string, int> PerBlockLimits(const std::vector<std::string>& grants, const catalog::BlockCatalog& catalog) const;

  int GlobalLimit(const std::vector<std::string>& grants) const;

  QuotaRecord Resolve(const std::vector<std::string>& grants, const catalog::BlockCatalog& catalog) const;

 private:
  std::string namespace_;
};

} // namespace claimstone::quota
