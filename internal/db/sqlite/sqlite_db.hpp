#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace claimstone::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Create tables used by the region store and the player directory.
  void BootstrapSchema();

  // Serializes use of the one connection: held by a SqliteTransaction for
  // its whole lifetime and by directory statements.
  std::mutex& Mutex() {
    return mutex_;
  }

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

} // namespace claimstone::db::sqlite
