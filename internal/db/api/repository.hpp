#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/region_record.hpp"

namespace claimstone::db {

/*
  Region store abstraction.

  The store is the source of truth for regions. Anything else (the alias
  index, the region plugin's own commands, world edits) may change it at any
  time; callers must not assume a record seen earlier still exists.

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - ListRegions returns records ordered by id
  - A read that fails in the backend throws util::StoreError; an absent
    world or region is never reported as a failure, and a failure is never
    reported as absent
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Worlds
  // ---------------------------------------------------------------------

  virtual Result CreateWorld(Transaction&, const std::string& world) = 0;

  virtual bool HasWorld(Transaction&, const std::string& world) = 0;

  virtual std::vector<std::string> ListWorlds(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Regions
  // ---------------------------------------------------------------------

  virtual std::optional<model::RegionRecord> GetRegion(Transaction&, const std::string& world, const std::string& id) = 0;

  virtual std::vector<model::RegionRecord> ListRegions(Transaction&, const std::string& world) = 0;

  // Inserts or replaces the record, including its owner/member lists.
  virtual Result UpsertRegion(Transaction&, const model::RegionRecord&) = 0;

  virtual Result DeleteRegion(Transaction&, const std::string& world, const std::string& id) = 0;
};

} // namespace claimstone::db
