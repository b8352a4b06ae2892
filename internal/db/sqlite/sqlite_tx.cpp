#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace waterfall::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  std::string error;
  const int   rc = db_->TryExec("BEGIN IMMEDIATE;", &error);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::LockContention("schedule database " + db_->Path() + " is locked by another run");
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error(error);
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!Open()) return;

  std::string error;
  if (db_->TryExec("ROLLBACK;", &error) != SQLITE_OK) {
    WATERFALL_LOG_WARN("sqlite rollback failed", {observability::StringField("db", db_->Path()), observability::StringField("error", error)});
  }
}

void SqliteTransaction::Commit() {
  if (!Open()) {
    throw std::logic_error("sqlite transaction already finished");
  }
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  if (!Open()) return;
  rolled_back_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace waterfall::db::sqlite
