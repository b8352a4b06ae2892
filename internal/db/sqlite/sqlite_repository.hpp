#pragma once

#include <memory>

#include "internal/db/api/schedule_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace waterfall::db::sqlite {

// Creates the single-row schedule table if missing.
void BootstrapSchema(SqliteDB& db);

class SqliteRepository final : public db::ScheduleRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<waterfall::model::Schedule> Load(Transaction&) override;
  Result Save(Transaction&, const waterfall::model::Schedule&) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace waterfall::db::sqlite
