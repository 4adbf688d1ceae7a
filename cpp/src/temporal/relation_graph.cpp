#include "kairos/temporal/relation_graph.hpp"
#include "kairos/core/log.hpp"

namespace kairos::temporal {

using namespace kairos::core;

namespace {
    // Carries the source fact's scope when the source can be read.
    [[nodiscard]] Status relation_error(db::FactStore& store, StatusCode code, FactId from) noexcept {
        Status s = with_fact(make_status(StatusDomain::Relation, code), from);
        TemporalFact source{};
        if (is_ok(store.fact_get(from, &source))) {
            s = with_scope(s, source.scope);
        }
        return s;
    }
}

Status RelationGraph::create_relation(FactId from, FactId to, RelationType type, float confidence) noexcept {
    if (!relation_type_allowed(type)) {
        return relation_error(store_, StatusCode::InvalidRelationType, from);
    }
    if (from == to || !(confidence >= 0.0f && confidence <= 1.0f)) {
        return relation_error(store_, StatusCode::Invalid, from);
    }

    db::ScopedTxn txn(store_);
    Status s = txn.begin();
    if (!is_ok(s)) {
        return with_fact(s, from);
    }

    TemporalFact source{};
    s = store_.fact_get(from, &source);
    if (!is_ok(s)) {
        return with_fact(s, from);
    }
    TemporalFact target{};
    s = store_.fact_get(to, &target);
    if (!is_ok(s)) {
        return with_scope(with_fact(s, to), source.scope);
    }

    s = store_.fact_set_relation(from, Relation{type, to, confidence});
    if (!is_ok(s)) {
        return with_scope(s, source.scope);
    }

    const RelationType inverse = relation_inverse(type);
    if (inverse != RelationType::None) {
        if (target.relation.has_value() &&
            (target.relation->type != inverse || target.relation->target != from)) {
            log_message(LogLevel::Debug, "relation", "fact %llu: %s -> %llu replaced by %s -> %llu",
                        static_cast<unsigned long long>(to.v),
                        relation_type_name(target.relation->type),
                        static_cast<unsigned long long>(target.relation->target.v),
                        relation_type_name(inverse),
                        static_cast<unsigned long long>(from.v));
        }
        s = store_.fact_set_relation(to, Relation{inverse, from, confidence});
        if (!is_ok(s)) {
            return with_scope(s, target.scope);
        }
    }

    s = txn.commit();
    if (!is_ok(s)) {
        return with_scope(with_fact(s, from), source.scope);
    }
    return ok_status();
}

Status RelationGraph::find_related(FactId fact, RelationType type, std::vector<TemporalFact>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Relation, StatusCode::Invalid);
    }
    out->clear();

    TemporalFact anchor{};
    Status s = store_.fact_get(fact, &anchor);
    if (!is_ok(s)) {
        return s;
    }
    if (!relation_type_allowed(type)) {
        return with_scope(with_fact(make_status(StatusDomain::Relation, StatusCode::InvalidRelationType), fact),
                          anchor.scope);
    }

    db::FactFilter filter{};
    filter.scope = anchor.scope;
    std::vector<TemporalFact> all;
    s = store_.fact_list(filter, &all);
    if (!is_ok(s)) {
        return with_fact(s, fact);
    }

    // "fact <type> f" is stored either on the anchor as (type, f) or on f as
    // (inverse, fact). The anchor's edge can point into another scope.
    const RelationType inverse = relation_inverse(type);
    const bool own_edge = anchor.relation.has_value() && anchor.relation->type == type;
    bool own_seen = false;
    for (const TemporalFact& f : all) {
        const bool points_here = inverse != RelationType::None && f.relation.has_value() &&
                                 f.relation->type == inverse && f.relation->target == fact;
        const bool own_target = own_edge && f.id == anchor.relation->target;
        if (points_here || own_target) {
            out->push_back(f);
        }
        own_seen = own_seen || own_target;
    }

    if (own_edge && !own_seen) {
        TemporalFact target{};
        s = store_.fact_get(anchor.relation->target, &target);
        if (is_ok(s)) {
            out->push_back(target);
        } else if (s.code != StatusCode::NotFound) {
            return with_fact(s, fact);
        }
    }
    return ok_status();
}

} // namespace kairos::temporal
