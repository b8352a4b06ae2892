#pragma once

namespace waterfall::db {

/*
  Abstract transaction over the persisted schedule.

  Semantics guaranteed for ALL backends:

  - Holding a transaction means holding the single-writer lock
  - Changes are invisible until Commit()
  - Commit() replaces the stored record atomically: readers and crash
    recovery see either the old or the new record, never a mix
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed and release the lock

  File:   flock + write-tmp/fsync/rename
  SQLite: BEGIN IMMEDIATE
  Memory: snapshot copy
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
