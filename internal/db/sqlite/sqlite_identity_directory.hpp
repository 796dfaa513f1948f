#pragma once

#include <memory>

#include "internal/identity/identity_directory.hpp"
#include "sqlite_db.hpp"

namespace claimstone::db::sqlite {

/*
  IdentityDirectory over the known_player table.
*/
class SqliteIdentityDirectory final : public identity::IdentityDirectory {
public:
  explicit SqliteIdentityDirectory(std::shared_ptr<SqliteDB> db);

  std::vector<model::Identity> Enumerate() override;

  // Records a (uuid, name) pair; a later name for the same uuid replaces it.
  void Remember(const model::Identity& identity);

private:
  std::shared_ptr<SqliteDB> db_;
};

}
