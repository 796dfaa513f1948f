#include "region_name_index.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace claimstone::index {

using observability::IntField;
using observability::StringField;

std::shared_ptr<RegionNameIndex::Partition> RegionNameIndex::Find(const std::string& world) const {
  std::shared_lock lock(partitions_mutex_);
  auto             it = partitions_.find(world);
  if (it == partitions_.end()) return nullptr;
  return it->second;
}

std::shared_ptr<RegionNameIndex::Partition> RegionNameIndex::FindOrCreate(const std::string& world) {
  if (auto existing = Find(world)) return existing;

  std::unique_lock lock(partitions_mutex_);
  auto&            slot = partitions_[world];
  if (!slot) slot = std::make_shared<Partition>();
  return slot;
}

// ------------------------------------------------------------
// Rebuild
// ------------------------------------------------------------

namespace {

std::unordered_map<std::string, std::vector<std::string>> GroupByAlias(const std::vector<model::RegionRecord>& snapshot, std::size_t& indexed) {
  std::unordered_map<std::string, std::vector<std::string>> by_alias;
  for (const auto& record : snapshot) {
    if (!model::IsProtectedRegion(record) || !record.alias) continue;
    by_alias[*record.alias].push_back(record.id);
    ++indexed;
  }
  return by_alias;
}

} // namespace

void RegionNameIndex::Rebuild(const std::string& world, const std::vector<model::RegionRecord>& snapshot) {
  Rebuild(world, [&snapshot] { return snapshot; });
}

void RegionNameIndex::Rebuild(const std::string& world, const Load& load) {
  auto             partition = FindOrCreate(world);
  std::scoped_lock lock(partition->mutex);

  std::size_t indexed = 0;
  partition->by_alias = GroupByAlias(load(), indexed);

  CLAIMSTONE_LOG_DEBUG("region name index rebuilt", {StringField("world", world), IntField("indexed", static_cast<std::int64_t>(indexed))});
}

// ------------------------------------------------------------
// Write-through maintenance
// ------------------------------------------------------------

void RegionNameIndex::Add(const std::string& world, const std::string& alias, const std::string& id) {
  auto             partition = FindOrCreate(world);
  std::scoped_lock lock(partition->mutex);

  auto& ids = partition->by_alias[alias];
  if (std::find(ids.begin(), ids.end(), id) == ids.end()) ids.push_back(id);
}

void RegionNameIndex::Remove(const std::string& world, const std::string& alias, const std::string& id) {
  auto partition = Find(world);
  if (!partition) return;

  std::scoped_lock lock(partition->mutex);
  auto             it = partition->by_alias.find(alias);
  if (it == partition->by_alias.end()) return;

  std::erase(it->second, id);
  if (it->second.empty()) partition->by_alias.erase(it);
}

// ------------------------------------------------------------
// Lookup with lazy eviction
// ------------------------------------------------------------

std::vector<model::RegionRecord> RegionNameIndex::Collect(const std::string& world, const std::string& alias, const Fetch& fetch) {
  std::vector<model::RegionRecord> live;

  auto partition = Find(world);
  if (!partition) return live;

  std::scoped_lock lock(partition->mutex);
  auto             it = partition->by_alias.find(alias);
  if (it == partition->by_alias.end()) return live;

  auto& ids = it->second;
  for (auto id = ids.begin(); id != ids.end();) {
    auto record = fetch(*id);
    if (!record) {
      CLAIMSTONE_LOG_DEBUG("evicting stale region from name index", {StringField("world", world), StringField("alias", alias), StringField("id", *id)});
      id = ids.erase(id);
      continue;
    }
    live.push_back(std::move(*record));
    ++id;
  }

  if (ids.empty()) partition->by_alias.erase(it);
  return live;
}

// ------------------------------------------------------------
// Inspection
// ------------------------------------------------------------

std::vector<std::string> RegionNameIndex::Ids(const std::string& world, const std::string& alias) const {
  auto partition = Find(world);
  if (!partition) return {};

  std::scoped_lock lock(partition->mutex);
  auto             it = partition->by_alias.find(alias);
  if (it == partition->by_alias.end()) return {};
  return it->second;
}

std::unordered_map<std::string, std::vector<std::string>> RegionNameIndex::Snapshot(const std::string& world) const {
  auto partition = Find(world);
  if (!partition) return {};

  std::scoped_lock lock(partition->mutex);
  return partition->by_alias;
}

std::vector<std::string> RegionNameIndex::Worlds() const {
  std::shared_lock         lock(partitions_mutex_);
  std::vector<std::string> out;
  out.reserve(partitions_.size());
  for (const auto& [world, _] : partitions_) out.push_back(world);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace claimstone::index
