#include "kairos/temporal/timeline_service.hpp"
#include "kairos/core/time.hpp"

namespace kairos::temporal {

using namespace kairos::core;

TimelineService::TimelineService(db::FactStore& store, EntityResolver& resolver, const TimelineConfig& cfg) noexcept
    : cfg_(cfg),
      store_(store, resolver, cfg.store),
      relations_(store),
      inference_(store, cfg.inference),
      segmenter_(store, resolver, cfg.segmenter),
      narrator_(store, resolver, cfg.narrator) {}

Status TimelineService::enhance(ScopeId scope, const OwnerRef& owner, Timestamp at,
                                std::optional<i64> duration_minutes, bool force_instant,
                                Granularity granularity, FactId* out) noexcept {
    if (duration_minutes.has_value() && *duration_minutes < 0) {
        return with_owner(with_scope(make_status(StatusDomain::Temporal, StatusCode::InvalidInterval), scope),
                          owner);
    }

    FactParams p{};
    p.owner = owner;
    p.scope = scope;
    p.start = at;
    p.granularity = granularity;
    if (!force_instant && duration_minutes.value_or(0) > 0) {
        p.region = RegionType::Interval;
        p.end = at + *duration_minutes * kSecondsPerMinute;
    } else {
        p.region = RegionType::Instant;
    }
    return store_.upsert_fact(p, out);
}

Status TimelineService::enhance_event(ScopeId scope, EntityId event, Timestamp at,
                                      std::optional<i64> duration_minutes, FactId* out,
                                      Granularity granularity) noexcept {
    return enhance(scope, OwnerRef{EntityKind::Event, event}, at, duration_minutes, false, granularity, out);
}

Status TimelineService::enhance_action(ScopeId scope, EntityId action, Timestamp at,
                                       std::optional<i64> duration_minutes, bool is_decision, FactId* out,
                                       Granularity granularity) noexcept {
    const OwnerRef owner{is_decision ? EntityKind::Decision : EntityKind::Action, action};
    return enhance(scope, owner, at, duration_minutes, is_decision, granularity, out);
}

} // namespace kairos::temporal
