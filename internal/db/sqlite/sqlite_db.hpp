#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace waterfall::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Same, but hands back the sqlite result code instead of throwing.
  int TryExec(const std::string& sql, std::string* error);

  // Configure PRAGMAs (WAL, durability, no busy wait)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace waterfall::db::sqlite
