#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "kairos/core/errors.hpp"
#include "kairos/core/models.hpp"
#include "kairos/core/types.hpp"

struct sqlite3;

namespace kairos::db {

    using kairos::core::EntityKind;
    using kairos::core::FactId;
    using kairos::core::i64;
    using kairos::core::OwnerRef;
    using kairos::core::Relation;
    using kairos::core::ScopeId;
    using kairos::core::Status;
    using kairos::core::TemporalFact;
    using kairos::core::Timestamp;
    using kairos::core::u32;

    struct DbConfig {
        const char* path = nullptr;          // nullptr -> ":memory:"
        const char* journal_mode = nullptr;  // nullptr -> $KAIROS_DB_JOURNAL_MODE, then "WAL"
    };

    // Scope-filtered query. Frame bounds apply the timeframe overlap rule:
    // instants need frame_start <= start <= frame_end, intervals need
    // start <= frame_end and (end >= frame_start or end is open).
    struct FactFilter {
        ScopeId scope{ScopeId::invalid()};
        std::optional<EntityKind> kind{};
        std::optional<Timestamp> frame_start{};
        std::optional<Timestamp> frame_end{};
        u32 limit{0};   // 0 = unlimited
    };

    // Transactional persistence for temporal facts. Results are always
    // ordered by (start, id).
    class FactStore {
    public:
        virtual ~FactStore() = default;

        // Transactions nest; an inner begin opens a savepoint.
        virtual Status txn_begin() noexcept = 0;
        virtual Status txn_commit() noexcept = 0;
        virtual Status txn_rollback() noexcept = 0;

        virtual Status scope_ensure(ScopeId scope) noexcept = 0;
        virtual Status scope_exists(ScopeId scope, bool* out) noexcept = 0;
        virtual Status scope_delete(ScopeId scope) noexcept = 0;

        virtual Status fact_insert(const TemporalFact& fact, FactId* out_id) noexcept = 0;
        // Rewrites the temporal fields of an existing fact. The relation is
        // left alone; the timeline order is reset to -1 when start changes.
        virtual Status fact_update(const TemporalFact& fact) noexcept = 0;
        virtual Status fact_get(FactId id, TemporalFact* out) noexcept = 0;
        virtual Status fact_find_by_owner(ScopeId scope, OwnerRef owner, TemporalFact* out) noexcept = 0;
        virtual Status fact_list(const FactFilter& filter, std::vector<TemporalFact>* out) noexcept = 0;
        virtual Status fact_set_relation(FactId id, const std::optional<Relation>& relation) noexcept = 0;
        virtual Status fact_set_timeline_order(FactId id, i64 order) noexcept = 0;
    };

    // Rolls back on destruction unless commit() succeeded.
    class ScopedTxn {
    public:
        explicit ScopedTxn(FactStore& store) noexcept : store_(store) {}
        ~ScopedTxn() { (void)rollback(); }

        ScopedTxn(const ScopedTxn&) = delete;
        ScopedTxn& operator=(const ScopedTxn&) = delete;

        [[nodiscard]] Status begin() noexcept {
            Status s = store_.txn_begin();
            active_ = core::is_ok(s);
            return s;
        }

        [[nodiscard]] Status commit() noexcept {
            if (!active_) {
                return core::make_status(core::StatusDomain::Db, core::StatusCode::Invalid);
            }
            Status s = store_.txn_commit();
            if (core::is_ok(s)) {
                active_ = false;
            }
            return s;
        }

        Status rollback() noexcept {
            if (!active_) {
                return core::ok_status();
            }
            active_ = false;
            return store_.txn_rollback();
        }

    private:
        FactStore& store_;
        bool active_{false};
    };

    class SqliteFactStore final : public FactStore {
    public:
        [[nodiscard]] static Status open(const DbConfig& cfg, std::unique_ptr<SqliteFactStore>* out) noexcept;
        ~SqliteFactStore() override;

        SqliteFactStore(const SqliteFactStore&) = delete;
        SqliteFactStore& operator=(const SqliteFactStore&) = delete;

        Status txn_begin() noexcept override;
        Status txn_commit() noexcept override;
        Status txn_rollback() noexcept override;

        Status scope_ensure(ScopeId scope) noexcept override;
        Status scope_exists(ScopeId scope, bool* out) noexcept override;
        Status scope_delete(ScopeId scope) noexcept override;

        Status fact_insert(const TemporalFact& fact, FactId* out_id) noexcept override;
        Status fact_update(const TemporalFact& fact) noexcept override;
        Status fact_get(FactId id, TemporalFact* out) noexcept override;
        Status fact_find_by_owner(ScopeId scope, OwnerRef owner, TemporalFact* out) noexcept override;
        Status fact_list(const FactFilter& filter, std::vector<TemporalFact>* out) noexcept override;
        Status fact_set_relation(FactId id, const std::optional<Relation>& relation) noexcept override;
        Status fact_set_timeline_order(FactId id, i64 order) noexcept override;

        // Filename of the main database ("" for in-memory).
        [[nodiscard]] const char* filename() const noexcept;
        [[nodiscard]] u32 txn_depth() const noexcept { return txn_depth_; }

    private:
        explicit SqliteFactStore(sqlite3* db) noexcept : db_(db) {}

        [[nodiscard]] Status exec(const char* sql) noexcept;

        sqlite3* db_ = nullptr;
        // Held from txn_begin until the matching commit/rollback.
        std::recursive_mutex mutex_;
        u32 txn_depth_{0};
    };

} // namespace kairos::db
