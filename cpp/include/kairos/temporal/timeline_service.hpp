#pragma once
#include <optional>
#include <string>
#include <vector>

#include "kairos/core/errors.hpp"
#include "kairos/core/models.hpp"
#include "kairos/db/db.hpp"
#include "kairos/temporal/config.hpp"
#include "kairos/temporal/entity_resolver.hpp"
#include "kairos/temporal/inference.hpp"
#include "kairos/temporal/narrator.hpp"
#include "kairos/temporal/relation_graph.hpp"
#include "kairos/temporal/segmenter.hpp"
#include "kairos/temporal/temporal_store.hpp"

namespace kairos::temporal {

    using kairos::core::EntityId;
    using kairos::core::Granularity;

    // Owns the temporal components over one fact store and one resolver.
    // Both must outlive the service.
    class TimelineService {
    public:
        TimelineService(db::FactStore& store, EntityResolver& resolver, const TimelineConfig& cfg = {}) noexcept;

        TimelineService(const TimelineService&) = delete;
        TimelineService& operator=(const TimelineService&) = delete;

        // Instant at `at`, or Interval [at, at + duration] for a positive
        // duration.
        Status enhance_event(ScopeId scope, EntityId event, Timestamp at,
                             std::optional<i64> duration_minutes, FactId* out,
                             Granularity granularity = Granularity::Minutes) noexcept;

        // Decisions are always Instants owned by a Decision reference; other
        // actions follow the event rule.
        Status enhance_action(ScopeId scope, EntityId action, Timestamp at,
                              std::optional<i64> duration_minutes, bool is_decision, FactId* out,
                              Granularity granularity = Granularity::Minutes) noexcept;

        TemporalStore& store() noexcept { return store_; }
        RelationGraph& relations() noexcept { return relations_; }
        InferenceEngine& inference() noexcept { return inference_; }
        Segmenter& segmenter() noexcept { return segmenter_; }
        Narrator& narrator() noexcept { return narrator_; }

        [[nodiscard]] const TimelineConfig& config() const noexcept { return cfg_; }

    private:
        Status enhance(ScopeId scope, const OwnerRef& owner, Timestamp at,
                       std::optional<i64> duration_minutes, bool force_instant,
                       Granularity granularity, FactId* out) noexcept;

        TimelineConfig cfg_;
        TemporalStore store_;
        RelationGraph relations_;
        InferenceEngine inference_;
        Segmenter segmenter_;
        Narrator narrator_;
    };

} // namespace kairos::temporal
