#include "kairos/temporal/inference.hpp"
#include "kairos/core/log.hpp"
#include "kairos/core/time.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace kairos::temporal {

using namespace kairos::core;

namespace {
    [[nodiscard]] Timestamp effective_end(const TemporalFact& f) noexcept {
        if (f.region == RegionType::Instant) {
            return f.start;
        }
        return f.end.value_or(INT64_MAX);
    }

    [[nodiscard]] bool has_duration(const TemporalFact& f) noexcept {
        return effective_end(f) > f.start;
    }
}

const char* allen_relation_name(AllenRelation r) noexcept {
    switch (r) {
        case AllenRelation::Before: return "before";
        case AllenRelation::Meets: return "meets";
        case AllenRelation::Overlaps: return "overlaps";
        case AllenRelation::Starts: return "starts";
        case AllenRelation::During: return "during";
        case AllenRelation::Finishes: return "finishes";
        case AllenRelation::Equals: return "equals";
        case AllenRelation::FinishedBy: return "finishedBy";
        case AllenRelation::Contains: return "contains";
        case AllenRelation::StartedBy: return "startedBy";
        case AllenRelation::OverlappedBy: return "overlappedBy";
        case AllenRelation::MetBy: return "metBy";
        case AllenRelation::After: return "after";
    }
    return "unknown";
}

std::mutex& ScopeLockTable::lock_for(ScopeId scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = locks_[scope.v];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

AllenRelation InferenceEngine::classify(const TemporalFact& a, const TemporalFact& b) noexcept {
    const Timestamp as = a.start;
    const Timestamp ae = effective_end(a);
    const Timestamp bs = b.start;
    const Timestamp be = effective_end(b);

    if (ae < bs) return AllenRelation::Before;
    if (be < as) return AllenRelation::After;
    if (as == bs && ae == be) return AllenRelation::Equals;
    if (as == bs) return ae < be ? AllenRelation::Starts : AllenRelation::StartedBy;
    if (ae == be) return as > bs ? AllenRelation::Finishes : AllenRelation::FinishedBy;
    if (ae == bs) return AllenRelation::Meets;
    if (be == as) return AllenRelation::MetBy;
    if (as < bs && ae > be) return AllenRelation::Contains;
    if (as > bs && ae < be) return AllenRelation::During;
    return as < bs ? AllenRelation::Overlaps : AllenRelation::OverlappedBy;
}

RelationType InferenceEngine::infer_pair(const TemporalFact& a, const TemporalFact& b) noexcept {
    // Rule 1: A is over by the time B starts. Instants need a strict gap so
    // that simultaneous instants fall through to rule 3.
    if (a.region == RegionType::Instant) {
        if (a.start < b.start) {
            return RelationType::Precedes;
        }
    } else if (a.end.has_value() && *a.end <= b.start) {
        return RelationType::Precedes;
    }

    // Rule 2: nesting or partial intersection.
    switch (classify(a, b)) {
        case AllenRelation::Overlaps:
        case AllenRelation::OverlappedBy:
        case AllenRelation::During:
        case AllenRelation::Contains:
            return RelationType::Overlaps;
        case AllenRelation::Starts:
        case AllenRelation::StartedBy:
        case AllenRelation::Finishes:
        case AllenRelation::FinishedBy:
        case AllenRelation::Equals:
            if (has_duration(a) && has_duration(b)) {
                return RelationType::Overlaps;
            }
            break;
        default:
            break;
    }

    // Rule 3: same calendar bucket at the coarser of the two granularities.
    const Granularity g = granularity_coarser(a.granularity, b.granularity);
    if (granularity_bucket(a.start, g) == granularity_bucket(b.start, g)) {
        return RelationType::CoincidesWith;
    }
    return RelationType::None;
}

Status InferenceEngine::infer_relations(ScopeId scope, InferenceStats* stats) noexcept {
    InferenceStats local{};
    InferenceStats* st = stats ? stats : &local;
    *st = InferenceStats{};

    std::lock_guard<std::mutex> scope_lock(locks_.lock_for(scope));

    db::ScopedTxn txn(store_);
    Status s = txn.begin();
    if (!is_ok(s)) {
        return with_scope(s, scope);
    }

    db::FactFilter filter{};
    filter.scope = scope;
    std::vector<TemporalFact> seq;
    s = store_.fact_list(filter, &seq);
    if (!is_ok(s)) {
        return with_scope(s, scope);
    }

    // Relations as they stand while this pass writes; eligibility of A is
    // judged on the snapshot taken above.
    std::vector<std::optional<Relation>> current;
    current.reserve(seq.size());
    for (const TemporalFact& f : seq) {
        current.push_back(f.relation);
    }

    const float conf = cfg_.inferred_confidence;
    for (std::size_t i = 0; i + 1 < seq.size(); ++i) {
        const TemporalFact& a = seq[i];
        const TemporalFact& b = seq[i + 1];
        if (a.relation.has_value()) {
            continue;
        }
        ++st->examined;

        const RelationType type = infer_pair(a, b);
        if (type == RelationType::None) {
            continue;
        }

        const Relation forward{type, b.id, conf};
        s = store_.fact_set_relation(a.id, forward);
        if (!is_ok(s)) {
            return with_scope(with_fact(s, a.id), scope);
        }
        current[i] = forward;
        ++st->inferred;

        const RelationType inverse = relation_inverse(type);
        if (inverse == RelationType::None) {
            continue;
        }
        if (current[i + 1].has_value() && !relation_is_inferred(*current[i + 1])) {
            ++st->inverses_kept;
            continue;
        }
        const Relation back{inverse, a.id, conf};
        s = store_.fact_set_relation(b.id, back);
        if (!is_ok(s)) {
            return with_scope(with_fact(s, b.id), scope);
        }
        current[i + 1] = back;
        ++st->inverses_written;
    }

    s = txn.commit();
    if (!is_ok(s)) {
        return with_scope(s, scope);
    }

    log_message(LogLevel::Info, "inference", "scope %u: %u pairs, %u inferred, %u inverses (%u kept)",
                static_cast<unsigned>(scope.v), st->examined, st->inferred,
                st->inverses_written, st->inverses_kept);
    return ok_status();
}

Status InferenceEngine::recompute_timeline_order(ScopeId scope, u32* assigned) noexcept {
    std::lock_guard<std::mutex> scope_lock(locks_.lock_for(scope));

    db::ScopedTxn txn(store_);
    Status s = txn.begin();
    if (!is_ok(s)) {
        return with_scope(s, scope);
    }

    db::FactFilter filter{};
    filter.scope = scope;
    std::vector<TemporalFact> seq;
    s = store_.fact_list(filter, &seq);
    if (!is_ok(s)) {
        return with_scope(s, scope);
    }

    for (std::size_t i = 0; i < seq.size(); ++i) {
        const i64 order = static_cast<i64>(i);
        if (seq[i].timeline_order == order) {
            continue;
        }
        s = store_.fact_set_timeline_order(seq[i].id, order);
        if (!is_ok(s)) {
            return with_scope(with_fact(s, seq[i].id), scope);
        }
    }

    s = txn.commit();
    if (!is_ok(s)) {
        return with_scope(s, scope);
    }
    if (assigned) {
        *assigned = static_cast<u32>(seq.size());
    }
    return ok_status();
}

} // namespace kairos::temporal
