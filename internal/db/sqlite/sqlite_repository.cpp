#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

#include "internal/db/model/schedule_record.hpp"
#include "internal/util/time.hpp"

namespace waterfall::db::sqlite {

using waterfall::db::ErrorCode;
using waterfall::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

void BootstrapSchema(SqliteDB& db) {
    db.Exec("CREATE TABLE IF NOT EXISTS schedule ("
            "id INTEGER PRIMARY KEY CHECK (id = 1), "
            "next_payment_date TEXT NOT NULL, "
            "last_executed_date TEXT, "
            "status INTEGER NOT NULL, "
            "updated_at_ms INTEGER NOT NULL);");

    db.Exec("SELECT next_payment_date,last_executed_date,status,updated_at_ms FROM schedule LIMIT 1;");
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

std::optional<waterfall::model::Schedule> SqliteRepository::Load(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT next_payment_date,last_executed_date,status FROM schedule WHERE id=1;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw std::runtime_error("sqlite read schedule: " + msg);
    }

    waterfall::v1::ScheduleRecord record;
    record.set_next_payment_date(ColText(st, 0));
    record.set_last_executed_date(ColText(st, 1));
    record.set_status(static_cast<waterfall::v1::ScheduleStatus>(ColI32(st, 2)));
    sqlite3_finalize(st);

    return model::FromRecord(record);
}

Result SqliteRepository::Save(Transaction& t, const waterfall::model::Schedule& schedule) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO schedule(id,next_payment_date,last_executed_date,status,updated_at_ms) VALUES(1,?,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET next_payment_date=excluded.next_payment_date, "
        "last_executed_date=excluded.last_executed_date, status=excluded.status, updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const auto record = model::ToRecord(schedule);
    BindText(st, 1, record.next_payment_date());
    if (record.last_executed_date().empty()) {
        sqlite3_bind_null(st, 2);
    } else {
        BindText(st, 2, record.last_executed_date());
    }
    BindI32(st, 3, static_cast<int>(record.status()));
    BindU64(st, 4, record.updated_at_ms());

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

} // namespace waterfall::db::sqlite
