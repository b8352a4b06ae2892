#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace waterfall::db::sqlite {

/*
  One run's hold on the schedule database.

  BEGIN IMMEDIATE takes the RESERVED lock before anything is read, so two
  runs can never both see the same Pending cycle. With busy_timeout at 0 a
  held lock surfaces as SQLITE_BUSY straight away and becomes
  util::LockContention.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  bool Open() const { return !committed_ && !rolled_back_; }

  std::shared_ptr<SqliteDB> db_;
  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace waterfall::db::sqlite
