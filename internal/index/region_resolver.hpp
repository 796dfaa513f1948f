#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/index/region_name_index.hpp"
#include "internal/model/region_record.hpp"
#include "internal/util/uuid.hpp"

namespace claimstone::index {

/*
  Resolves a caller-supplied token to protected regions.

  A token is first tried as a region id; an exact id hit wins over any alias
  match. Otherwise the token is an alias and the index is consulted (and
  pruned) for it. An unknown world throws util::ScopeNotFound; an empty
  result just means nothing matched.
*/
class RegionResolver {
 public:
  RegionResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<RegionNameIndex> index);

  std::vector<model::RegionRecord> Resolve(const std::string& world, const std::string& token);

  // True if a live region in any indexed world carries this alias.
  bool AliasExistsAnywhere(const std::string& alias);

  // Regions in the world owned by the principal, or listing it as member
  // when include_members is set.
  std::vector<model::RegionRecord> RegionsForPrincipal(const std::string& world, const util::UUID& principal, bool include_members);

 private:
  RegionNameIndex::Fetch LiveWithAlias(std::unique_ptr<db::Transaction>& tx, const std::string& world, const std::string& alias);

  // Collect for one world, reading the store only under the partition lock.
  std::vector<model::RegionRecord> CollectLive(const std::string& world, const std::string& alias);

  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<RegionNameIndex> index_;
};

} // namespace claimstone::index
