#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace claimstone::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::CreateWorld(Transaction& t, const std::string& world) {
  auto& s = TX(t).Mutable();
  if (s.worlds.contains(world)) return Result::Err(ErrorCode::AlreadyExists, world);
  s.worlds[world];
  return Result::Ok();
}

bool MemoryRepository::HasWorld(Transaction& t, const std::string& world) {
  return TX(t).View().worlds.contains(world);
}

std::vector<std::string> MemoryRepository::ListWorlds(Transaction& t) {
  std::vector<std::string> out;
  for (const auto& [name, _] : TX(t).View().worlds)
    out.push_back(name);
  return out;
}

std::optional<model::RegionRecord> MemoryRepository::GetRegion(Transaction& t, const std::string& world, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        wt = s.worlds.find(world);
  if (wt == s.worlds.end()) return std::nullopt;
  auto it = wt->second.find(id);
  if (it == wt->second.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RegionRecord> MemoryRepository::ListRegions(Transaction& t, const std::string& world) {
  const auto&                      s = TX(t).View();
  std::vector<model::RegionRecord> records;
  auto                             wt = s.worlds.find(world);
  if (wt == s.worlds.end()) return records;
  records.reserve(wt->second.size());
  for (const auto& [_, record] : wt->second) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpsertRegion(Transaction& t, const model::RegionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  wt = s.worlds.find(r.world);
  if (wt == s.worlds.end()) return Result::Err(ErrorCode::NotFound, "world " + r.world);
  wt->second[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteRegion(Transaction& t, const std::string& world, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  wt = s.worlds.find(world);
  if (wt == s.worlds.end()) return Result::Err(ErrorCode::NotFound, "world " + world);
  if (wt->second.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

} // namespace claimstone::db::memory
