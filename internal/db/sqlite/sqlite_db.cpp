#include "sqlite_db.hpp"

#include <stdexcept>

namespace waterfall::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  std::string error;
  if (TryExec(sql, &error) != SQLITE_OK) {
    throw std::runtime_error(error);
  }
}

int SqliteDB::TryExec(const std::string& sql, std::string* error) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK && error) {
    *error = err ? err : "sqlite exec failed";
  }
  sqlite3_free(err);
  return rc;
}

void SqliteDB::Configure() {
  Exec("PRAGMA journal_mode=WAL;");

  // one small row per cycle; pay for full durability
  Exec("PRAGMA synchronous=FULL;");

  // a second run must see SQLITE_BUSY at once and report Busy, not wait
  ThrowIf(sqlite3_busy_timeout(db_, 0), db_, "busy_timeout");
}

} // namespace waterfall::db::sqlite
