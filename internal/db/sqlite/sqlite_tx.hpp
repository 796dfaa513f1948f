#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace claimstone::db::sqlite {

/*
  BEGIN IMMEDIATE takes the write lock up front, so a migration pass that
  reads a world and writes regions back never has to upgrade a read lock
  while the host's region plugin holds one. The connection is shared, so a
  transaction holds the connection mutex from BEGIN until it finishes; a
  Begin() on another thread waits for it. Opening a second transaction on
  the same thread while one is open deadlocks.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_ = false;
};

}
