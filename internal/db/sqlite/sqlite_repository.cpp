#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace causal::db::sqlite {

using causal::db::ErrorCode;
using causal::db::Result;

namespace {

struct BoundValue {
    enum class Kind { kText, kInt64 } kind;
    std::string text;
    int64_t     number = 0;
};

// Finalizes on every exit, including a throwing ReadEvent.
struct StatementGuard {
    sqlite3_stmt* st = nullptr;
    ~StatementGuard() {
        if (st) sqlite3_finalize(st);
    }
};

} // namespace

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
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

static bool ColNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

// Reads have no Result channel; a failed prepare or step surfaces here.
[[noreturn]] static void ThrowReadError(const Result& result, const std::string& context) {
    auto message = context + " (" + ErrorCodeName(result.code) + ")";
    if (!result.message.empty()) message += ": " + result.message;
    throw util::StorageError(message);
}

// Row layout follows sql::EVENT_COLUMNS.
static model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.id           = sqlite3_column_int64(st, 0);
    r.version      = ColNull(st, 1) ? 1 : sqlite3_column_int(st, 1);
    r.timestamp_ms = static_cast<uint64_t>(sqlite3_column_int64(st, 2));
    r.actor        = ColText(st, 3);
    r.origin       = ColText(st, 4);
    r.command      = ColText(st, 5);
    if (!ColNull(st, 7)) r.correlation_id = ColText(st, 7);
    if (!ColNull(st, 8)) r.causation_id = sqlite3_column_int64(st, 8);
    try {
        r.payload  = util::FromJson(ColText(st, 6));
        r.metadata = util::FromJson(ColText(st, 9));
    } catch (const std::exception& e) {
        ThrowReadError(Result::Err(ErrorCode::Corruption, e.what()), "read event " + std::to_string(r.id));
    }
    return r;
}

// unset values persist as an empty object, matching the memory backend
static std::string StoredJson(const google::protobuf::Value& v) {
    if (v.kind_case() == google::protobuf::Value::KIND_NOT_SET) return "{}";
    return util::ToJson(v);
}


static std::string WhereClause(const EventFilter& f, std::vector<BoundValue>& binds) {
    std::string where;
    auto add = [&](const std::string& clause) {
        where += where.empty() ? " WHERE " : " AND ";
        where += clause;
    };

    if (f.correlation_id) {
        add("correlation_id=?");
        binds.push_back({BoundValue::Kind::kText, *f.correlation_id});
    }
    if (f.causation_id) {
        add("causation_id=?");
        binds.push_back({BoundValue::Kind::kInt64, {}, *f.causation_id});
    }
    if (f.actor) {
        add("actor=?");
        binds.push_back({BoundValue::Kind::kText, *f.actor});
    }
    if (f.command) {
        add("command=?");
        binds.push_back({BoundValue::Kind::kText, *f.command});
    }
    if (f.roots_only) {
        add("causation_id IS NULL");
    }
    if (f.min_id) {
        add("id>=?");
        binds.push_back({BoundValue::Kind::kInt64, {}, *f.min_id});
    }
    if (f.max_id) {
        add("id<=?");
        binds.push_back({BoundValue::Kind::kInt64, {}, *f.max_id});
    }
    if (f.min_timestamp_ms) {
        add("timestamp>=?");
        binds.push_back({BoundValue::Kind::kInt64, {}, static_cast<int64_t>(*f.min_timestamp_ms)});
    }
    if (f.max_timestamp_ms) {
        add("timestamp<=?");
        binds.push_back({BoundValue::Kind::kInt64, {}, static_cast<int64_t>(*f.max_timestamp_ms)});
    }
    return where;
}

static void BindAll(sqlite3_stmt* st, const std::vector<BoundValue>& binds, int& idx) {
    for (const auto& b : binds) {
        if (b.kind == BoundValue::Kind::kText) {
            BindText(st, idx++, b.text);
        } else {
            BindI64(st, idx++, b.number);
        }
    }
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db, sql::IndexOptions indexes)
    : db_(std::move(db)), indexes_(indexes) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kRead);
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

sqlite3_stmt* SqliteRepository::PrepareRead(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(st);
        ThrowReadError(Translate(db, rc), "sqlite prepare");
    }
    return st;
}

// Steps to SQLITE_DONE; anything else mid-scan is an error, not a short result.
std::vector<model::EventRecord> SqliteRepository::ReadAll(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::EventRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadEvent(st));
    }
    if (rc != SQLITE_DONE) ThrowReadError(Translate(db, rc), "sqlite step");
    return out;
}

std::optional<model::EventRecord> SqliteRepository::ReadOne(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowReadError(Translate(db, rc), "sqlite step");
    return ReadEvent(st);
}

void SqliteRepository::Bootstrap() {
    for (const auto& statement : sql::BootstrapStatements(indexes_)) {
        db_->Exec(statement);
    }
}

// ------------------------------------------------------------------
// Append
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
    auto* db = TX(t).Handle();

    StatementGuard guard;
    if (sqlite3_prepare_v2(db, sql::INSERT_EVENT, -1, &guard.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    auto* st = guard.st;

    std::string payload_json;
    std::string metadata_json;
    try {
        payload_json  = StoredJson(r.payload);
        metadata_json = StoredJson(r.metadata);
    } catch (const std::exception& e) {
        return Result::Err(ErrorCode::ConstraintViolation, e.what());
    }

    BindI32(st, 1, r.version);
    BindU64(st, 2, r.timestamp_ms);
    BindText(st, 3, r.actor);
    BindText(st, 4, r.origin);
    BindText(st, 5, r.command);
    BindText(st, 6, payload_json);
    if (r.correlation_id) {
        BindText(st, 7, *r.correlation_id);
    } else {
        sqlite3_bind_null(st, 7);
    }
    if (r.causation_id) {
        BindI64(st, 8, *r.causation_id);
    } else {
        sqlite3_bind_null(st, 8);
    }
    BindText(st, 9, metadata_json);

    // RETURNING: id assignment and row capture happen in one step
    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) return Translate(db, rc);

    r = ReadEvent(st);

    rc = sqlite3_step(st);
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<model::EventRecord>
SqliteRepository::GetEvent(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    StatementGuard guard{PrepareRead(db, sql::SELECT_EVENT)};
    BindI64(guard.st, 1, id);
    return ReadOne(db, guard.st);
}

std::optional<model::EventRecord>
SqliteRepository::GetLastEvent(Transaction& t) {
    auto* db = TX(t).Handle();

    StatementGuard guard{PrepareRead(db, sql::SELECT_LAST_EVENT)};
    return ReadOne(db, guard.st);
}

std::vector<model::EventRecord> SqliteRepository::ListEvents(
    Transaction& t, const EventFilter& filter, EventOrder order, const Pagination& pagination) {
    auto* db = TX(t).Handle();

    std::vector<BoundValue> binds;
    std::string sql = std::string("SELECT ") + sql::EVENT_COLUMNS + " FROM events" + WhereClause(filter, binds);
    sql += order == EventOrder::kNewestFirst ? " ORDER BY timestamp DESC, id DESC" : " ORDER BY id ASC";
    if (pagination.limit.has_value()) {
        sql += " LIMIT ? OFFSET ?";
    } else if (pagination.offset > 0) {
        sql += " LIMIT -1 OFFSET ?";
    }
    sql += ";";

    StatementGuard guard{PrepareRead(db, sql.c_str())};

    int bind_idx = 1;
    BindAll(guard.st, binds, bind_idx);
    if (pagination.limit.has_value()) {
        BindU64(guard.st, bind_idx++, *pagination.limit);
        BindU64(guard.st, bind_idx++, pagination.offset);
    } else if (pagination.offset > 0) {
        BindU64(guard.st, bind_idx++, pagination.offset);
    }

    return ReadAll(db, guard.st);
}

uint64_t SqliteRepository::CountEvents(Transaction& t, const EventFilter& filter) {
    auto* db = TX(t).Handle();

    std::vector<BoundValue> binds;
    std::string sql = "SELECT COUNT(*) FROM events" + WhereClause(filter, binds) + ";";

    StatementGuard guard{PrepareRead(db, sql.c_str())};

    int bind_idx = 1;
    BindAll(guard.st, binds, bind_idx);

    int rc = sqlite3_step(guard.st);
    if (rc != SQLITE_ROW) ThrowReadError(Translate(db, rc), "sqlite step");
    return static_cast<uint64_t>(sqlite3_column_int64(guard.st, 0));
}

std::vector<model::EventRecord> SqliteRepository::ListOrphans(Transaction& t) {
    auto* db = TX(t).Handle();

    StatementGuard guard{PrepareRead(db, sql::SELECT_ORPHANS)};
    return ReadAll(db, guard.st);
}

// ------------------------------------------------------------------
// Reset (test-only)
// ------------------------------------------------------------------

Result SqliteRepository::Reset() {
    try {
        SqliteTransaction tx(db_, SqliteTransaction::Mode::kWrite);
        db_->Exec(sql::DROP_EVENTS);
        db_->Exec(sql::RESET_SEQUENCE);
        for (const auto& statement : sql::BootstrapStatements(indexes_)) {
            db_->Exec(statement);
        }
        tx.Commit();
    } catch (const std::exception& e) {
        return Result::Err(ErrorCode::InternalError, e.what());
    }
    return Result::Ok();
}

}
