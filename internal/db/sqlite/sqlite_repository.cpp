#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <optional>
#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace dispatcher::db::sqlite {

using dispatcher::db::ErrorCode;
using dispatcher::db::Result;

namespace {

/*
  Owns a prepared statement for the duration of one call.
*/
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
            const std::string msg = sqlite3_errmsg(db);
            sqlite3_finalize(st_);
            throw DbError(ErrorCode::InternalError, "sqlite prepare: " + msg);
        }
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }

    void BindText(int idx, const std::string& s) {
        sqlite3_bind_text(st_, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }

    void BindOptionalText(int idx, const std::optional<std::string>& s) {
        if (s) {
            BindText(idx, *s);
        } else {
            sqlite3_bind_null(st_, idx);
        }
    }

    void BindI64(int idx, int64_t v) {
        sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v));
    }

    int Step() { return sqlite3_step(st_); }

private:
    sqlite3_stmt* st_ = nullptr;
};

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    if (!t) return "";
    return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

model::ProcessRow ReadRow(sqlite3_stmt* st) {
    model::ProcessRow r;
    r.uuid = ColText(st, 0);
    r.source_id = ColI64(st, 1);
    r.state = ColText(st, 2);
    r.type = ColI64(st, 3);
    r.created_at_ms = ColI64(st, 4);
    r.supervisor_id = ColOptionalText(st, 5);
    return r;
}

} // namespace

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

    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
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
// Process lifecycle
// ------------------------------------------------------------------

Result SqliteRepository::InsertProcess(Transaction& t, const model::ProcessRow& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_PROCESS);
    st.BindText(1, r.uuid);
    st.BindI64(2, r.source_id);
    st.BindText(3, r.state);
    st.BindI64(4, r.type);
    st.BindI64(5, r.created_at_ms);
    st.BindOptionalText(6, r.supervisor_id);

    return Translate(db, st.Step());
}

std::optional<model::ProcessRow>
SqliteRepository::GetProcess(Transaction& t, const std::string& uuid) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_PROCESS);
    st.BindText(1, uuid);

    const int rc = st.Step();
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw DbError(Translate(db, rc));

    return ReadRow(st.get());
}

Result SqliteRepository::CompareAndSetState(Transaction& t, const std::string& uuid,
                                            const std::string& expected, const std::string& next) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPDATE_PROCESS_STATE);
    st.BindText(1, next);
    st.BindText(2, uuid);
    st.BindText(3, expected);

    auto result = Translate(db, st.Step());
    if (!result) return result;
    if (sqlite3_changes(db) == 1) return Result::Ok();

    // Nothing matched: tell a vanished row apart from a lost race.
    if (!GetProcess(t, uuid)) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "state of " + uuid + " is no longer " + expected);
}

Result SqliteRepository::CompareAndAssign(Transaction& t, const std::string& uuid, const std::string& expected,
                                          const std::string& next, const std::string& supervisor_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::ASSIGN_PROCESS);
    st.BindText(1, next);
    st.BindText(2, supervisor_id);
    st.BindText(3, uuid);
    st.BindText(4, expected);

    auto result = Translate(db, st.Step());
    if (!result) return result;
    if (sqlite3_changes(db) == 1) return Result::Ok();

    auto current = GetProcess(t, uuid);
    if (!current) return Result::Err(ErrorCode::NotFound);
    if (current->supervisor_id) return Result::Err(ErrorCode::Conflict, uuid + " already assigned to " + *current->supervisor_id);
    return Result::Err(ErrorCode::Conflict, "state of " + uuid + " is no longer " + expected);
}

Result SqliteRepository::DeleteProcess(Transaction& t, const std::string& uuid) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_PROCESS);
    st.BindText(1, uuid);

    auto result = Translate(db, st.Step());
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::vector<model::ProcessRow>
SqliteRepository::ListProcessesBySource(Transaction& t, uint32_t source_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::LIST_PROCESSES_BY_SOURCE);
    st.BindI64(1, source_id);

    std::vector<model::ProcessRow> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.push_back(ReadRow(st.get()));
    }
    if (rc != SQLITE_DONE) throw DbError(Translate(db, rc));
    return out;
}

std::optional<model::ProcessRow>
SqliteRepository::LatestProcessForSource(Transaction& t, uint32_t source_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::LATEST_PROCESS_FOR_SOURCE);
    st.BindI64(1, source_id);

    const int rc = st.Step();
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw DbError(Translate(db, rc));

    return ReadRow(st.get());
}

std::vector<model::ProcessRow>
SqliteRepository::ListProcessesInState(Transaction& t, const std::string& state, std::size_t limit) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::LIST_PROCESSES_IN_STATE);
    st.BindText(1, state);
    st.BindI64(2, static_cast<int64_t>(limit));

    std::vector<model::ProcessRow> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.push_back(ReadRow(st.get()));
    }
    if (rc != SQLITE_DONE) throw DbError(Translate(db, rc));
    return out;
}

std::vector<std::pair<std::string, uint64_t>>
SqliteRepository::CountProcessesByState(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::COUNT_PROCESSES_BY_STATE);

    std::vector<std::pair<std::string, uint64_t>> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.emplace_back(ColText(st.get(), 0), static_cast<uint64_t>(ColI64(st.get(), 1)));
    }
    if (rc != SQLITE_DONE) throw DbError(Translate(db, rc));
    return out;
}

} // namespace dispatcher::db::sqlite
