#pragma once

namespace claimstone::db {

/*
  Unit of work against the region store.

  - Writes stay private until Commit()
  - Commit() of a transaction that only read always succeeds
  - Destroying an unfinished transaction rolls it back

  The index resolver keeps one transaction open across an id lookup and the
  re-check of every alias candidate, so a prune decision and the records it
  returns come from the same view.

  SQLite: BEGIN IMMEDIATE on the shared connection (one open at a time)
  Memory: private copy of the store, optimistic check on Commit()
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // Throws if the backend refuses the commit (memory: a concurrent writer
  // committed first).
  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace claimstone::db
