#include "kairos/temporal/segmenter.hpp"
#include "kairos/core/log.hpp"

#include <algorithm>
#include <cstring>
#include <string>

namespace kairos::temporal {

using namespace kairos::core;

namespace {
    constexpr const char* kStrategyNames[] = {"by_actor", "by_gap", "by_kind", "auto"};
    constexpr const char* kUnassigned = "unassigned";
}

const char* segment_strategy_name(SegmentStrategy s) noexcept {
    const auto i = static_cast<u32>(s);
    return i < 4 ? kStrategyNames[i] : "unknown";
}

bool segment_strategy_parse(const char* name, SegmentStrategy* out) noexcept {
    if (!name || !out) {
        return false;
    }
    for (u32 i = 0; i < 4; ++i) {
        if (std::strcmp(kStrategyNames[i], name) == 0) {
            *out = static_cast<SegmentStrategy>(i);
            return true;
        }
    }
    return false;
}

void sort_for_timeline(std::vector<TemporalFact>* facts) {
    const bool ordered = std::all_of(facts->begin(), facts->end(),
                                     [](const TemporalFact& f) { return f.timeline_order >= 0; });
    if (ordered) {
        std::stable_sort(facts->begin(), facts->end(), [](const TemporalFact& a, const TemporalFact& b) {
            return a.timeline_order < b.timeline_order;
        });
    } else {
        std::stable_sort(facts->begin(), facts->end(), core::fact_chrono_less);
    }
}

Status Segmenter::group(ScopeId scope, SegmentStrategy strategy, const SegmentParams& params,
                        std::vector<Segment>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Segment, StatusCode::Invalid);
    }
    out->clear();

    const i64 threshold = params.gap_threshold_seconds.value_or(cfg_.gap_threshold_seconds);
    const u32 batch = params.batch_size.value_or(cfg_.batch_size);
    if (strategy == SegmentStrategy::ByGap && threshold < 0) {
        return with_scope(make_status(StatusDomain::Segment, StatusCode::Invalid), scope);
    }
    if (strategy == SegmentStrategy::Auto && batch == 0) {
        return with_scope(make_status(StatusDomain::Segment, StatusCode::Invalid), scope);
    }

    db::FactFilter filter{};
    filter.scope = scope;
    std::vector<TemporalFact> facts;
    Status s = store_.fact_list(filter, &facts);
    if (!is_ok(s)) {
        return with_scope(s, scope);
    }
    sort_for_timeline(&facts);

    switch (strategy) {
        case SegmentStrategy::ByActor:
            group_by_actor(facts, out);
            break;
        case SegmentStrategy::ByGap:
            group_by_gap(facts, threshold, out);
            break;
        case SegmentStrategy::ByKind:
            group_by_kind(facts, out);
            break;
        case SegmentStrategy::Auto:
            group_in_batches(facts, batch, out);
            break;
    }
    return ok_status();
}

void Segmenter::group_by_actor(const std::vector<TemporalFact>& facts, std::vector<Segment>* out) {
    for (const TemporalFact& f : facts) {
        std::string key = kUnassigned;

        EntityInfo info;
        const Status s = resolver_.resolve(f.owner, &info);
        if (!is_ok(s)) {
            log_status(LogLevel::Warn, "segment", "actor lookup failed", with_fact(s, f.id));
        } else if (info.actor.has_value() && info.actor->is_valid()) {
            key = std::to_string(info.actor->v);
        }

        auto it = std::find_if(out->begin(), out->end(), [&](const Segment& seg) { return seg.key == key; });
        if (it == out->end()) {
            out->push_back(Segment{key, {}});
            it = out->end() - 1;
        }
        it->facts.push_back(f);
    }
}

void Segmenter::group_by_gap(const std::vector<TemporalFact>& facts, i64 threshold, std::vector<Segment>* out) {
    const TemporalFact* prev = nullptr;
    for (const TemporalFact& f : facts) {
        if (!prev || f.start - prev->start > threshold) {
            out->push_back(Segment{"segment_" + std::to_string(out->size()), {}});
        }
        out->back().facts.push_back(f);
        prev = &f;
    }
}

void Segmenter::group_by_kind(const std::vector<TemporalFact>& facts, std::vector<Segment>* out) {
    out->push_back(Segment{"events", {}});
    out->push_back(Segment{"actions", {}});
    out->push_back(Segment{"decisions", {}});
    for (const TemporalFact& f : facts) {
        (*out)[static_cast<std::size_t>(f.owner.kind)].facts.push_back(f);
    }
}

void Segmenter::group_in_batches(const std::vector<TemporalFact>& facts, u32 batch, std::vector<Segment>* out) {
    for (std::size_t i = 0; i < facts.size(); ++i) {
        if (i % batch == 0) {
            out->push_back(Segment{"batch_" + std::to_string(out->size()), {}});
        }
        out->back().facts.push_back(facts[i]);
    }
}

} // namespace kairos::temporal
