#include "kairos/db/db.hpp"
#include "kairos/core/log.hpp"

#include <sqlite3.h>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <new>
#include <string>

namespace kairos::db {

using namespace kairos::core;

namespace {
    constexpr const char* kSchemaSQL = R"SQL(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS scopes (
            id INTEGER PRIMARY KEY,
            created_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS facts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            scope_id INTEGER NOT NULL REFERENCES scopes(id) ON DELETE CASCADE,
            owner_kind INTEGER NOT NULL,
            owner_id INTEGER NOT NULL,
            region INTEGER NOT NULL,
            start_ts INTEGER NOT NULL,
            end_ts INTEGER,
            granularity INTEGER NOT NULL,
            confidence REAL NOT NULL DEFAULT 1.0,
            relation_type INTEGER NOT NULL DEFAULT 0,
            relation_target INTEGER,
            relation_confidence REAL NOT NULL DEFAULT 1.0,
            timeline_order INTEGER NOT NULL DEFAULT -1,
            UNIQUE (scope_id, owner_kind, owner_id)
        );
        CREATE INDEX IF NOT EXISTS idx_facts_scope_start ON facts(scope_id, start_ts, id);
        CREATE INDEX IF NOT EXISTS idx_facts_relation ON facts(relation_target, relation_type);
    )SQL";

    // Column order shared by every SELECT that feeds read_fact_row.
    constexpr const char* kFactColumns =
        "id, scope_id, owner_kind, owner_id, region, start_ts, end_ts, granularity, confidence, "
        "relation_type, relation_target, relation_confidence, timeline_order";

    void read_fact_row(sqlite3_stmt* stmt, TemporalFact* out) noexcept {
        out->id = FactId{static_cast<u64>(sqlite3_column_int64(stmt, 0))};
        out->scope = ScopeId{static_cast<u32>(sqlite3_column_int64(stmt, 1))};
        out->owner.kind = static_cast<EntityKind>(sqlite3_column_int(stmt, 2));
        out->owner.id = EntityId{static_cast<u64>(sqlite3_column_int64(stmt, 3))};
        out->region = static_cast<RegionType>(sqlite3_column_int(stmt, 4));
        out->start = sqlite3_column_int64(stmt, 5);
        if (sqlite3_column_type(stmt, 6) == SQLITE_NULL) {
            out->end.reset();
        } else {
            out->end = sqlite3_column_int64(stmt, 6);
        }
        out->granularity = static_cast<Granularity>(sqlite3_column_int(stmt, 7));
        out->confidence = static_cast<float>(sqlite3_column_double(stmt, 8));

        const auto rel_type = static_cast<RelationType>(sqlite3_column_int(stmt, 9));
        if (rel_type != RelationType::None && sqlite3_column_type(stmt, 10) != SQLITE_NULL) {
            Relation rel{};
            rel.type = rel_type;
            rel.target = FactId{static_cast<u64>(sqlite3_column_int64(stmt, 10))};
            rel.confidence = static_cast<float>(sqlite3_column_double(stmt, 11));
            out->relation = rel;
        } else {
            out->relation.reset();
        }
        out->timeline_order = sqlite3_column_int64(stmt, 12);
    }

    void bind_optional_ts(sqlite3_stmt* stmt, int idx, const std::optional<Timestamp>& ts) noexcept {
        if (ts.has_value()) {
            sqlite3_bind_int64(stmt, idx, *ts);
        } else {
            sqlite3_bind_null(stmt, idx);
        }
    }

    [[nodiscard]] Status sqlite_status(int rc) noexcept {
        switch (rc & 0xff) {
            case SQLITE_OK:
            case SQLITE_DONE:
            case SQLITE_ROW:
                return ok_status();
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                return make_status(StatusDomain::Db, StatusCode::Busy, static_cast<u32>(rc));
            case SQLITE_CONSTRAINT:
                return make_status(StatusDomain::Db, StatusCode::Conflict, static_cast<u32>(rc));
            case SQLITE_CORRUPT:
            case SQLITE_NOTADB:
                return make_status(StatusDomain::Db, StatusCode::Corrupt, static_cast<u32>(rc));
            case SQLITE_IOERR:
            case SQLITE_CANTOPEN:
            case SQLITE_FULL:
                return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
            default:
                return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(rc));
        }
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

Status SqliteFactStore::open(const DbConfig& cfg, std::unique_ptr<SqliteFactStore>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* path = cfg.path ? cfg.path : ":memory:";
    sqlite3* handle = nullptr;
    int rc = sqlite3_open(path, &handle);
    if (rc != SQLITE_OK) {
        log_message(LogLevel::Error, "db", "cannot open %s: %s", path,
                    handle ? sqlite3_errmsg(handle) : "out of memory");
        if (handle) {
            sqlite3_close(handle);
        }
        return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
    }
    sqlite3_busy_timeout(handle, 5000);

    const char* journal_mode = cfg.journal_mode;
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = std::getenv("KAIROS_DB_JOURNAL_MODE");
    }
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }

    char* err_msg = nullptr;
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    rc = sqlite3_exec(handle, journal_sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        // In-memory databases reject WAL; the default journal still works.
        log_message(LogLevel::Debug, "db", "journal_mode=%s rejected: %s", journal_mode,
                    err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        err_msg = nullptr;
    }
    sqlite3_exec(handle, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);
    sqlite3_exec(handle, "PRAGMA temp_store=MEMORY", nullptr, nullptr, nullptr);

    rc = sqlite3_exec(handle, kSchemaSQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        log_message(LogLevel::Error, "db", "schema failed: %s", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        sqlite3_close(handle);
        return sqlite_status(rc);
    }

    out->reset(new (std::nothrow) SqliteFactStore(handle));
    if (!*out) {
        sqlite3_close(handle);
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }
    return ok_status();
}

SqliteFactStore::~SqliteFactStore() {
    if (db_) {
        while (txn_depth_ > 0) {
            (void)txn_rollback();
        }
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

const char* SqliteFactStore::filename() const noexcept {
    const char* name = db_ ? sqlite3_db_filename(db_, "main") : nullptr;
    return name ? name : "";
}

Status SqliteFactStore::exec(const char* sql) noexcept {
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        log_message(LogLevel::Debug, "db", "%s: %s", sql, err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        return sqlite_status(rc);
    }
    return ok_status();
}

// ============================================================================
// Transaction Management
// ============================================================================

Status SqliteFactStore::txn_begin() noexcept {
    mutex_.lock();

    std::string sql;
    if (txn_depth_ == 0) {
        sql = "BEGIN IMMEDIATE TRANSACTION";
    } else {
        sql = "SAVEPOINT kairos_sp_" + std::to_string(txn_depth_);
    }

    Status s = exec(sql.c_str());
    if (!is_ok(s)) {
        mutex_.unlock();
        return s;
    }
    ++txn_depth_;
    return ok_status();
}

Status SqliteFactStore::txn_commit() noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (txn_depth_ == 0) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql;
    if (txn_depth_ == 1) {
        sql = "COMMIT";
    } else {
        sql = "RELEASE SAVEPOINT kairos_sp_" + std::to_string(txn_depth_ - 1);
    }

    Status s = exec(sql.c_str());
    if (!is_ok(s)) {
        // Transaction stays open; the caller is expected to roll back.
        return s;
    }
    --txn_depth_;
    mutex_.unlock();
    return ok_status();
}

Status SqliteFactStore::txn_rollback() noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (txn_depth_ == 0) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    Status s;
    if (txn_depth_ == 1) {
        s = exec("ROLLBACK");
    } else {
        const std::string name = "kairos_sp_" + std::to_string(txn_depth_ - 1);
        s = exec(("ROLLBACK TO SAVEPOINT " + name).c_str());
        if (is_ok(s)) {
            s = exec(("RELEASE SAVEPOINT " + name).c_str());
        }
    }

    // The unit is abandoned either way; never leave the lock held.
    --txn_depth_;
    mutex_.unlock();
    return s;
}

// ============================================================================
// Scope Operations
// ============================================================================

Status SqliteFactStore::scope_ensure(ScopeId scope) noexcept {
    if (!scope.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "INSERT OR IGNORE INTO scopes (id, created_at) VALUES (?, ?)",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }

    sqlite3_bind_int64(stmt, 1, scope.v);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(std::time(nullptr)));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return with_scope(sqlite_status(rc), scope);
    }
    return ok_status();
}

Status SqliteFactStore::scope_exists(ScopeId scope, bool* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT 1 FROM scopes WHERE id = ? LIMIT 1", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }

    sqlite3_bind_int64(stmt, 1, scope.v);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_ROW) {
        *out = true;
        return ok_status();
    }
    if (rc == SQLITE_DONE) {
        *out = false;
        return ok_status();
    }
    return with_scope(sqlite_status(rc), scope);
}

Status SqliteFactStore::scope_delete(ScopeId scope) noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "DELETE FROM scopes WHERE id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }

    sqlite3_bind_int64(stmt, 1, scope.v);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return with_scope(sqlite_status(rc), scope);
    }
    if (sqlite3_changes(db_) == 0) {
        return with_scope(make_status(StatusDomain::Db, StatusCode::NotFound), scope);
    }
    return ok_status();
}

// ============================================================================
// Fact Operations
// ============================================================================

Status SqliteFactStore::fact_insert(const TemporalFact& fact, FactId* out_id) noexcept {
    if (!out_id) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    const char* sql = "INSERT INTO facts (scope_id, owner_kind, owner_id, region, start_ts, end_ts, "
                      "granularity, confidence, timeline_order) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }

    sqlite3_bind_int64(stmt, 1, fact.scope.v);
    sqlite3_bind_int(stmt, 2, static_cast<int>(fact.owner.kind));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(fact.owner.id.v));
    sqlite3_bind_int(stmt, 4, static_cast<int>(fact.region));
    sqlite3_bind_int64(stmt, 5, fact.start);
    bind_optional_ts(stmt, 6, fact.end);
    sqlite3_bind_int(stmt, 7, static_cast<int>(fact.granularity));
    sqlite3_bind_double(stmt, 8, fact.confidence);
    sqlite3_bind_int64(stmt, 9, fact.timeline_order);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return with_owner(with_scope(sqlite_status(rc), fact.scope), fact.owner);
    }

    *out_id = FactId{static_cast<u64>(sqlite3_last_insert_rowid(db_))};
    return ok_status();
}

Status SqliteFactStore::fact_update(const TemporalFact& fact) noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    // Moving the start invalidates the stored timeline order; -1 sends
    // readers back to (start, id) until the next recompute.
    const char* sql = "UPDATE facts SET region = ?, "
                      "timeline_order = CASE WHEN start_ts = ?2 THEN timeline_order ELSE -1 END, "
                      "start_ts = ?2, end_ts = ?, granularity = ?, confidence = ? WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }

    sqlite3_bind_int(stmt, 1, static_cast<int>(fact.region));
    sqlite3_bind_int64(stmt, 2, fact.start);
    bind_optional_ts(stmt, 3, fact.end);
    sqlite3_bind_int(stmt, 4, static_cast<int>(fact.granularity));
    sqlite3_bind_double(stmt, 5, fact.confidence);
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(fact.id.v));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return with_fact(sqlite_status(rc), fact.id);
    }
    if (sqlite3_changes(db_) == 0) {
        return with_fact(make_status(StatusDomain::Db, StatusCode::NotFound), fact.id);
    }
    return ok_status();
}

Status SqliteFactStore::fact_get(FactId id, TemporalFact* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    const std::string sql = std::string("SELECT ") + kFactColumns + " FROM facts WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        read_fact_row(stmt, out);
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc == SQLITE_DONE) {
        return with_fact(make_status(StatusDomain::Db, StatusCode::NotFound), id);
    }
    return with_fact(sqlite_status(rc), id);
}

Status SqliteFactStore::fact_find_by_owner(ScopeId scope, OwnerRef owner, TemporalFact* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    const std::string sql = std::string("SELECT ") + kFactColumns +
                            " FROM facts WHERE scope_id = ? AND owner_kind = ? AND owner_id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }

    sqlite3_bind_int64(stmt, 1, scope.v);
    sqlite3_bind_int(stmt, 2, static_cast<int>(owner.kind));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(owner.id.v));

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        read_fact_row(stmt, out);
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    Status s = rc == SQLITE_DONE ? make_status(StatusDomain::Db, StatusCode::NotFound) : sqlite_status(rc);
    return with_owner(with_scope(s, scope), owner);
}

Status SqliteFactStore::fact_list(const FactFilter& filter, std::vector<TemporalFact>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    out->clear();

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    // Build SQL query with filters
    std::string sql = std::string("SELECT ") + kFactColumns + " FROM facts WHERE scope_id = ?";

    const bool has_kind = filter.kind.has_value();
    const bool has_frame = filter.frame_start.has_value() || filter.frame_end.has_value();
    const Timestamp frame_start = filter.frame_start.value_or(INT64_MIN);
    const Timestamp frame_end = filter.frame_end.value_or(INT64_MAX);

    if (has_kind) {
        sql += " AND owner_kind = ?";
    }
    if (has_frame) {
        sql += " AND ((region = 0 AND start_ts >= ? AND start_ts <= ?)"
               " OR (region = 1 AND start_ts <= ? AND (end_ts IS NULL OR end_ts >= ?)))";
    }

    sql += " ORDER BY start_ts ASC, id ASC";

    if (filter.limit > 0) {
        sql += " LIMIT ?";
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }

    // Bind parameters
    int param_idx = 1;
    sqlite3_bind_int64(stmt, param_idx++, filter.scope.v);

    if (has_kind) {
        sqlite3_bind_int(stmt, param_idx++, static_cast<int>(*filter.kind));
    }
    if (has_frame) {
        sqlite3_bind_int64(stmt, param_idx++, frame_start);
        sqlite3_bind_int64(stmt, param_idx++, frame_end);
        sqlite3_bind_int64(stmt, param_idx++, frame_end);
        sqlite3_bind_int64(stmt, param_idx++, frame_start);
    }
    if (filter.limit > 0) {
        sqlite3_bind_int64(stmt, param_idx++, filter.limit);
    }

    for (;;) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            TemporalFact fact{};
            read_fact_row(stmt, &fact);
            out->push_back(fact);
        } else if (rc == SQLITE_DONE) {
            break;
        } else {
            sqlite3_finalize(stmt);
            out->clear();
            return with_scope(sqlite_status(rc), filter.scope);
        }
    }

    sqlite3_finalize(stmt);
    return ok_status();
}

Status SqliteFactStore::fact_set_relation(FactId id, const std::optional<Relation>& relation) noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    const char* sql = "UPDATE facts SET relation_type = ?, relation_target = ?, relation_confidence = ? "
                      "WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }

    if (relation.has_value()) {
        sqlite3_bind_int(stmt, 1, static_cast<int>(relation->type));
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(relation->target.v));
        sqlite3_bind_double(stmt, 3, relation->confidence);
    } else {
        sqlite3_bind_int(stmt, 1, static_cast<int>(RelationType::None));
        sqlite3_bind_null(stmt, 2);
        sqlite3_bind_double(stmt, 3, kAssertedConfidence);
    }
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return with_fact(sqlite_status(rc), id);
    }
    if (sqlite3_changes(db_) == 0) {
        return with_fact(make_status(StatusDomain::Db, StatusCode::NotFound), id);
    }
    return ok_status();
}

Status SqliteFactStore::fact_set_timeline_order(FactId id, i64 order) noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "UPDATE facts SET timeline_order = ? WHERE id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }

    sqlite3_bind_int64(stmt, 1, order);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return with_fact(sqlite_status(rc), id);
    }
    if (sqlite3_changes(db_) == 0) {
        return with_fact(make_status(StatusDomain::Db, StatusCode::NotFound), id);
    }
    return ok_status();
}

} // namespace kairos::db
