#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace claimstone::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  [[noreturn]] static void ThrowRead(sqlite3* db, int rc, const std::string& what);

  // Fills owners/members of an already-read region row.
  static void LoadPrincipals(sqlite3* db, model::RegionRecord& r);

  std::shared_ptr<SqliteDB> db_;
};

}
