#include "region_resolver.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace claimstone::index {

RegionResolver::RegionResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<RegionNameIndex> index)
    : repository_(std::move(repository)), index_(std::move(index)) {
}

// A region renamed out of band no longer counts for its old alias. The
// transaction is opened on the first fetch, which Collect makes under the
// partition lock, so the store view is never older than the alias list.
RegionNameIndex::Fetch RegionResolver::LiveWithAlias(std::unique_ptr<db::Transaction>& tx, const std::string& world, const std::string& alias) {
  return [this, &tx, world, alias](const std::string& id) -> std::optional<model::RegionRecord> {
    if (!tx) tx = repository_->Begin();
    auto record = repository_->GetRegion(*tx, world, id);
    if (!record || !model::IsProtectedRegion(*record) || record->alias != alias) return std::nullopt;
    return record;
  };
}

std::vector<model::RegionRecord> RegionResolver::CollectLive(const std::string& world, const std::string& alias) {
  std::unique_ptr<db::Transaction> tx;
  auto                             matches = index_->Collect(world, alias, LiveWithAlias(tx, world, alias));
  if (tx) tx->Commit();
  return matches;
}

std::vector<model::RegionRecord> RegionResolver::Resolve(const std::string& world, const std::string& token) {
  {
    auto tx = repository_->Begin();
    if (!repository_->HasWorld(*tx, world)) {
      throw util::ScopeNotFound(world);
    }

    if (auto by_id = repository_->GetRegion(*tx, world, token); by_id && model::IsProtectedRegion(*by_id)) {
      tx->Commit();
      return {std::move(*by_id)};
    }
    tx->Commit();
  }

  return CollectLive(world, token);
}

bool RegionResolver::AliasExistsAnywhere(const std::string& alias) {
  for (const auto& world : index_->Worlds()) {
    if (!CollectLive(world, alias).empty()) return true;
  }
  return false;
}

std::vector<model::RegionRecord> RegionResolver::RegionsForPrincipal(const std::string& world, const util::UUID& principal, bool include_members) {
  auto tx = repository_->Begin();
  if (!repository_->HasWorld(*tx, world)) {
    throw util::ScopeNotFound(world);
  }

  const model::PrincipalRef        ref = model::ById{principal};
  std::vector<model::RegionRecord> out;
  for (auto& record : repository_->ListRegions(*tx, world)) {
    if (!model::IsProtectedRegion(record)) continue;

    const bool owner  = std::find(record.owners.begin(), record.owners.end(), ref) != record.owners.end();
    const bool member = include_members && std::find(record.members.begin(), record.members.end(), ref) != record.members.end();
    if (owner || member) out.push_back(std::move(record));
  }

  tx->Commit();
  return out;
}

} // namespace claimstone::index
