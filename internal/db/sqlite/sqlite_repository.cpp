#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace storykb::db::sqlite {

using storykb::db::ErrorCode;
using storykb::db::Result;

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

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static constexpr const char* kEventColumns =
    "sequence,transaction_id,entity_id,timestamp_ms,change_type,status,payload,phase,adapter,detail";

static model::ChangeEventRecord ReadEvent(sqlite3_stmt* st) {
    model::ChangeEventRecord r;
    r.sequence = ColU64(st, 0);
    r.transaction_id = ColText(st, 1);
    r.entity_id = ColText(st, 2);
    r.timestamp_ms = ColU64(st, 3);
    r.change_type = static_cast<model::ChangeType>(ColI32(st, 4));
    r.status = static_cast<model::ChangeStatus>(ColI32(st, 5));
    r.payload = ColText(st, 6);
    r.phase = ColText(st, 7);
    r.adapter = ColText(st, 8);
    r.detail = ColText(st, 9);
    return r;
}

static std::vector<model::ChangeEventRecord> ReadEvents(sqlite3_stmt* st) {
    std::vector<model::ChangeEventRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadEvent(st));
    }
    return out;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, tx_mutex_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Identity
// ------------------------------------------------------------------

Result SqliteRepository::InsertIdentity(Transaction& t, const model::IdentityRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO entity_identity(natural_key,entity_id,created_at_ms) VALUES(?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.natural_key);
    BindText(st.get(), 2, r.entity_id);
    BindU64(st.get(), 3, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()) == SQLITE_DONE ? SQLITE_DONE : sqlite3_extended_errcode(db));
}

std::optional<model::IdentityRecord>
SqliteRepository::GetIdentityByKey(Transaction& t, const std::string& natural_key) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT natural_key,entity_id,created_at_ms FROM entity_identity WHERE natural_key=?;");
    if (!st) return std::nullopt;

    BindText(st.get(), 1, natural_key);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::IdentityRecord r;
    r.natural_key = ColText(st.get(), 0);
    r.entity_id = ColText(st.get(), 1);
    r.created_at_ms = ColU64(st.get(), 2);
    return r;
}

std::optional<model::IdentityRecord>
SqliteRepository::GetIdentityById(Transaction& t, const std::string& entity_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT natural_key,entity_id,created_at_ms FROM entity_identity WHERE entity_id=?;");
    if (!st) return std::nullopt;

    BindText(st.get(), 1, entity_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::IdentityRecord r;
    r.natural_key = ColText(st.get(), 0);
    r.entity_id = ColText(st.get(), 1);
    r.created_at_ms = ColU64(st.get(), 2);
    return r;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::AppendChangeEvent(Transaction& t, model::ChangeEventRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO change_event(transaction_id,entity_id,timestamp_ms,change_type,status,payload,phase,adapter,detail) "
        "VALUES(?,?,?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.transaction_id);
    BindText(st.get(), 2, r.entity_id);
    BindU64(st.get(), 3, r.timestamp_ms);
    BindI32(st.get(), 4, static_cast<int>(r.change_type));
    BindI32(st.get(), 5, static_cast<int>(r.status));
    BindText(st.get(), 6, r.payload);
    BindText(st.get(), 7, r.phase);
    BindText(st.get(), 8, r.adapter);
    BindText(st.get(), 9, r.detail);

    if (sqlite3_step(st.get()) != SQLITE_DONE)
        return Translate(db, sqlite3_extended_errcode(db));

    r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::ChangeEventRecord>
SqliteRepository::GetLatestChangeEvent(Transaction& t, const std::string& transaction_id) {
    auto* db = TX(t).Handle();

    const auto sql = std::string("SELECT ") + kEventColumns +
                     " FROM change_event WHERE transaction_id=? ORDER BY sequence DESC LIMIT 1;";
    Statement st(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.get(), 1, transaction_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadEvent(st.get());
}

std::vector<model::ChangeEventRecord>
SqliteRepository::ListChangeEventsByEntity(Transaction& t, const std::string& entity_id) {
    auto* db = TX(t).Handle();

    const auto sql = std::string("SELECT ") + kEventColumns +
                     " FROM change_event WHERE entity_id=? ORDER BY sequence ASC;";
    Statement st(db, sql.c_str());
    if (!st) return {};

    BindText(st.get(), 1, entity_id);
    return ReadEvents(st.get());
}

std::vector<model::ChangeEventRecord>
SqliteRepository::ListChangeEventsByTransaction(Transaction& t, const std::string& transaction_id) {
    auto* db = TX(t).Handle();

    const auto sql = std::string("SELECT ") + kEventColumns +
                     " FROM change_event WHERE transaction_id=? ORDER BY sequence ASC;";
    Statement st(db, sql.c_str());
    if (!st) return {};

    BindText(st.get(), 1, transaction_id);
    return ReadEvents(st.get());
}

std::vector<model::ChangeEventRecord>
SqliteRepository::ListLatestByStatus(Transaction& t, model::ChangeStatus status, std::size_t limit) {
    auto* db = TX(t).Handle();

    const auto sql = std::string("SELECT ") + kEventColumns +
                     " FROM change_event e WHERE status=? AND sequence=("
                     "SELECT MAX(sequence) FROM change_event l WHERE l.transaction_id=e.transaction_id) "
                     "ORDER BY sequence ASC LIMIT ?;";
    Statement st(db, sql.c_str());
    if (!st) return {};

    BindI32(st.get(), 1, static_cast<int>(status));
    // sqlite treats a negative LIMIT as unbounded
    sqlite3_bind_int64(st.get(), 2, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));
    return ReadEvents(st.get());
}

} // namespace storykb::db::sqlite
