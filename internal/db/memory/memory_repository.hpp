#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace claimstone::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result CreateWorld(Transaction&, const std::string& world) override;
  bool HasWorld(Transaction&, const std::string& world) override;
  std::vector<std::string> ListWorlds(Transaction&) override;

  std::optional<model::RegionRecord> GetRegion(Transaction&, const std::string& world,
                                               const std::string& id) override;
  std::vector<model::RegionRecord> ListRegions(Transaction&, const std::string& world) override;
  Result UpsertRegion(Transaction&, const model::RegionRecord&) override;
  Result DeleteRegion(Transaction&, const std::string& world, const std::string& id) override;

private:
  friend class MemoryTransaction;

  // Ordered maps keep ListWorlds/ListRegions deterministic.
  struct State {
    std::map<std::string, std::map<std::string, model::RegionRecord>> worlds;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
