#include "kairos/temporal/temporal_store.hpp"
#include "kairos/core/log.hpp"

namespace kairos::temporal {

using namespace kairos::core;

namespace {
    [[nodiscard]] Status temporal_error(StatusCode code, const FactParams& p) noexcept {
        return with_owner(with_scope(make_status(StatusDomain::Temporal, code), p.scope), p.owner);
    }
}

Status TemporalStore::validate(const FactParams& p) const noexcept {
    if (!p.scope.is_valid() || !p.owner.id.is_valid()) {
        return temporal_error(StatusCode::Invalid, p);
    }
    if (!(p.confidence >= 0.0f && p.confidence <= 1.0f)) {
        return temporal_error(StatusCode::Invalid, p);
    }

    if (p.region == RegionType::Instant) {
        if (p.end.has_value()) {
            return temporal_error(StatusCode::InvalidRegion, p);
        }
        return ok_status();
    }

    if (!p.end.has_value()) {
        return cfg_.allow_open_intervals ? ok_status() : temporal_error(StatusCode::InvalidInterval, p);
    }
    if (*p.end < p.start) {
        return temporal_error(StatusCode::InvalidInterval, p);
    }
    return ok_status();
}

Status TemporalStore::upsert_fact(const FactParams& params, FactId* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Temporal, StatusCode::Invalid);
    }

    Status s = validate(params);
    if (!is_ok(s)) {
        log_status(LogLevel::Debug, "temporal", "upsert rejected", s);
        return s;
    }

    EntityInfo info;
    s = resolver_.resolve(params.owner, &info);
    if (!is_ok(s)) {
        if (s.code == StatusCode::NotFound) {
            return temporal_error(StatusCode::NotFound, params);
        }
        return with_owner(with_scope(s, params.scope), params.owner);
    }

    db::ScopedTxn txn(store_);
    s = txn.begin();
    if (!is_ok(s)) {
        return with_scope(s, params.scope);
    }

    s = store_.scope_ensure(params.scope);
    if (!is_ok(s)) {
        return with_scope(s, params.scope);
    }

    TemporalFact fact{};
    s = store_.fact_find_by_owner(params.scope, params.owner, &fact);
    const bool exists = is_ok(s);
    if (!exists && s.code != StatusCode::NotFound) {
        return s;
    }

    fact.owner = params.owner;
    fact.scope = params.scope;
    fact.region = params.region;
    fact.start = params.start;
    fact.end = params.end;
    fact.granularity = params.granularity;
    fact.confidence = params.confidence;

    if (exists) {
        s = store_.fact_update(fact);
    } else {
        s = store_.fact_insert(fact, &fact.id);
    }
    if (!is_ok(s)) {
        return with_owner(with_scope(s, params.scope), params.owner);
    }

    s = txn.commit();
    if (!is_ok(s)) {
        return with_fact(with_scope(s, params.scope), fact.id);
    }

    *out = fact.id;
    return ok_status();
}

Status TemporalStore::get_fact(FactId id, TemporalFact* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Temporal, StatusCode::Invalid);
    }
    return store_.fact_get(id, out);
}

Status TemporalStore::find_by_owner(ScopeId scope, const OwnerRef& owner, TemporalFact* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Temporal, StatusCode::Invalid);
    }
    return store_.fact_find_by_owner(scope, owner, out);
}

Status TemporalStore::find_in_timeframe(ScopeId scope, Timestamp frame_start, Timestamp frame_end,
                                        std::optional<EntityKind> kind,
                                        std::vector<TemporalFact>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Temporal, StatusCode::Invalid);
    }
    if (frame_end < frame_start) {
        return with_scope(make_status(StatusDomain::Temporal, StatusCode::InvalidInterval), scope);
    }

    db::FactFilter filter{};
    filter.scope = scope;
    filter.kind = kind;
    filter.frame_start = frame_start;
    filter.frame_end = frame_end;
    return store_.fact_list(filter, out);
}

Status TemporalStore::find_sequence(ScopeId scope, std::optional<EntityKind> kind, std::optional<u32> limit,
                                    std::vector<TemporalFact>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Temporal, StatusCode::Invalid);
    }
    if (limit.has_value() && *limit == 0) {
        out->clear();
        return ok_status();
    }

    db::FactFilter filter{};
    filter.scope = scope;
    filter.kind = kind;
    filter.limit = limit.value_or(0);
    return store_.fact_list(filter, out);
}

Status TemporalStore::scope_exists(ScopeId scope, bool* out) noexcept {
    return store_.scope_exists(scope, out);
}

Status TemporalStore::delete_scope(ScopeId scope) noexcept {
    db::ScopedTxn txn(store_);
    Status s = txn.begin();
    if (!is_ok(s)) {
        return with_scope(s, scope);
    }
    s = store_.scope_delete(scope);
    if (!is_ok(s)) {
        return with_scope(s, scope);
    }
    return txn.commit();
}

} // namespace kairos::temporal
