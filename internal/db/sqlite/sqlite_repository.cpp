#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace runlens::db::sqlite {

using runlens::db::ErrorCode;
using runlens::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static model::ActivityRecord ReadActivity(sqlite3_stmt* st) {
    model::ActivityRecord r;
    r.hash = ColText(st, 0);
    r.filename = ColText(st, 1);
    r.date = ColText(st, 2);
    r.json = ColText(st, 3);
    r.session_id = ColI64(st, 4);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, /*write=*/true);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(db_, /*write=*/false);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Activities
// ------------------------------------------------------------------

Result SqliteRepository::ActivityExists(Transaction& t, const std::string& hash, bool& exists) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::EXISTS_ACTIVITY, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    BindText(st, 1, hash);

    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    exists = (rc == SQLITE_ROW);
    return Translate(db, rc);
}

Result SqliteRepository::UpsertActivity(Transaction& t, const model::ActivityRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::UPSERT_ACTIVITY, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    BindText(st, 1, r.hash);
    BindText(st, 2, r.filename);
    BindText(st, 3, r.date);
    BindText(st, 4, r.json);
    BindI64(st, 5, r.session_id);

    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::DeleteActivity(Transaction& t, const std::string& hash) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::DELETE_ACTIVITY, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    BindText(st, 1, hash);
    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    // deleting an absent row is not an error
    return Translate(db, rc);
}

Result SqliteRepository::CountActivities(Transaction& t, uint64_t& count) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::COUNT_ACTIVITIES, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    rc = sqlite3_step(st);
    if (rc == SQLITE_ROW)
        count = static_cast<uint64_t>(ColI64(st, 0));
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::GetActivity(Transaction& t, const std::string& hash,
                                     std::optional<model::ActivityRecord>& out) {
    auto* db = TX(t).Handle();
    out.reset();

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::SELECT_ACTIVITY, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    BindText(st, 1, hash);

    rc = sqlite3_step(st);
    if (rc == SQLITE_ROW)
        out = ReadActivity(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::ListActivities(Transaction& t, const ActivityFilter& filter,
                                        std::vector<model::ActivityRecord>& out) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::LIST_ACTIVITIES, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    if (filter.min_date)
        BindText(st, 1, *filter.min_date);
    else
        sqlite3_bind_null(st, 1);

    if (filter.session_id)
        BindI64(st, 2, *filter.session_id);
    else
        sqlite3_bind_null(st, 2);

    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadActivity(st));
    }

    sqlite3_finalize(st);
    return Translate(db, rc);
}

}
