#pragma once
#include <map>
#include <memory>
#include <mutex>

#include "kairos/core/errors.hpp"
#include "kairos/core/models.hpp"
#include "kairos/core/relation.hpp"
#include "kairos/db/db.hpp"
#include "kairos/temporal/config.hpp"

namespace kairos::temporal {

    using kairos::core::RelationType;
    using kairos::core::ScopeId;
    using kairos::core::Status;
    using kairos::core::TemporalFact;
    using kairos::core::u32;

    // Allen's interval algebra, from the point of view of the first argument.
    enum class AllenRelation : core::u8 {
        Before = 0,
        Meets,
        Overlaps,
        Starts,
        During,
        Finishes,
        Equals,
        FinishedBy,
        Contains,
        StartedBy,
        OverlappedBy,
        MetBy,
        After,
    };

    const char* allen_relation_name(AllenRelation r) noexcept;

    struct InferenceStats {
        u32 examined{0};           // adjacent pairs looked at
        u32 inferred{0};           // forward relations written
        u32 inverses_written{0};
        u32 inverses_kept{0};      // target held an asserted relation
    };

    // One mutex per scope so inference and reordering of the same scope
    // never interleave. Different scopes do not contend.
    class ScopeLockTable {
    public:
        std::mutex& lock_for(ScopeId scope);

    private:
        std::mutex mutex_;
        std::map<core::u32, std::unique_ptr<std::mutex>> locks_;
    };

    class InferenceEngine {
    public:
        explicit InferenceEngine(db::FactStore& store, const InferenceConfig& cfg = {}) noexcept
            : store_(store), cfg_(cfg) {}

        // Instants are zero-length intervals and open intervals end at
        // +infinity.
        [[nodiscard]] static AllenRelation classify(const TemporalFact& a, const TemporalFact& b) noexcept;

        // The relation infer_relations would give a chronologically ordered
        // pair, or None.
        [[nodiscard]] static RelationType infer_pair(const TemporalFact& a, const TemporalFact& b) noexcept;

        // Walks adjacent pairs (A, B) of the scope's sequence and gives each
        // A that has no relation one inferred relation to B. Inverses land
        // on B only when B holds nothing or another inferred relation.
        Status infer_relations(ScopeId scope, InferenceStats* stats = nullptr) noexcept;

        // Dense zero-based order over (start, id). Idempotent.
        Status recompute_timeline_order(ScopeId scope, u32* assigned = nullptr) noexcept;

        [[nodiscard]] const InferenceConfig& config() const noexcept { return cfg_; }

    private:
        db::FactStore& store_;
        InferenceConfig cfg_;
        ScopeLockTable locks_;
    };

} // namespace kairos::temporal
