#pragma once
#include <optional>
#include <vector>

#include "kairos/core/errors.hpp"
#include "kairos/core/models.hpp"
#include "kairos/core/types.hpp"
#include "kairos/db/db.hpp"
#include "kairos/temporal/config.hpp"
#include "kairos/temporal/entity_resolver.hpp"

namespace kairos::temporal {

    using kairos::core::EntityKind;
    using kairos::core::FactId;
    using kairos::core::Granularity;
    using kairos::core::RegionType;
    using kairos::core::ScopeId;
    using kairos::core::TemporalFact;
    using kairos::core::Timestamp;
    using kairos::core::u32;

    struct FactParams {
        OwnerRef owner{};
        ScopeId scope{ScopeId::invalid()};
        RegionType region{RegionType::Instant};
        Timestamp start{0};
        std::optional<Timestamp> end{};
        Granularity granularity{Granularity::Minutes};
        float confidence{core::kAssertedConfidence};
    };

    // Typed storage and query of temporal facts. One fact per
    // (owner, scope); re-upserting overwrites it in place.
    class TemporalStore {
    public:
        TemporalStore(db::FactStore& store, EntityResolver& resolver,
                      const TemporalStoreConfig& cfg = {}) noexcept
            : store_(store), resolver_(resolver), cfg_(cfg) {}

        // Fails with InvalidRegion for an Instant with an end, InvalidInterval
        // for end < start, Invalid for confidence outside [0, 1] and NotFound
        // when the owner does not resolve. Nothing is written on failure.
        Status upsert_fact(const FactParams& params, FactId* out) noexcept;

        Status get_fact(FactId id, TemporalFact* out) noexcept;
        Status find_by_owner(ScopeId scope, const OwnerRef& owner, TemporalFact* out) noexcept;

        // Facts intersecting [frame_start, frame_end], ascending by start.
        Status find_in_timeframe(ScopeId scope, Timestamp frame_start, Timestamp frame_end,
                                 std::optional<EntityKind> kind, std::vector<TemporalFact>* out) noexcept;

        // All facts of the scope ascending by (start, id), optionally truncated.
        Status find_sequence(ScopeId scope, std::optional<EntityKind> kind, std::optional<u32> limit,
                             std::vector<TemporalFact>* out) noexcept;

        Status scope_exists(ScopeId scope, bool* out) noexcept;

        // Removes the scope and every fact in it.
        Status delete_scope(ScopeId scope) noexcept;

        [[nodiscard]] const TemporalStoreConfig& config() const noexcept { return cfg_; }

    private:
        [[nodiscard]] Status validate(const FactParams& params) const noexcept;

        db::FactStore& store_;
        EntityResolver& resolver_;
        TemporalStoreConfig cfg_;
    };

} // namespace kairos::temporal
