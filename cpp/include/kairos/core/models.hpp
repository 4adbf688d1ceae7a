#pragma once
#include <optional>
#include <type_traits>

#include "kairos/core/relation.hpp"
#include "kairos/core/types.hpp"

namespace kairos::core {

    inline constexpr float kAssertedConfidence = 1.0f;

    struct Relation {
        RelationType type{RelationType::None};
        FactId target{FactId::invalid()};
        float confidence{kAssertedConfidence};
    };

    // Inferred relations are the ones written below full confidence.
    [[nodiscard]] constexpr bool relation_is_inferred(const Relation& r) noexcept {
        return r.confidence < kAssertedConfidence;
    }

    struct TemporalFact {
        FactId id{FactId::invalid()};
        OwnerRef owner{};
        ScopeId scope{ScopeId::invalid()};
        RegionType region{RegionType::Instant};
        Timestamp start{0};
        std::optional<Timestamp> end{};       // always empty for Instant; empty Interval is ongoing
        Granularity granularity{Granularity::Minutes};
        float confidence{kAssertedConfidence};
        std::optional<Relation> relation{};   // at most one outgoing relation
        i64 timeline_order{-1};               // -1 until recompute_timeline_order runs
    };

    [[nodiscard]] constexpr bool fact_is_open_interval(const TemporalFact& f) noexcept {
        return f.region == RegionType::Interval && !f.end.has_value();
    }

    // Chronological sort key used everywhere a stable order is required.
    [[nodiscard]] constexpr bool fact_chrono_less(const TemporalFact& a, const TemporalFact& b) noexcept {
        if (a.start != b.start) {
            return a.start < b.start;
        }
        return a.id.v < b.id.v;
    }

    static_assert(std::is_trivially_copyable_v<Relation>);
    static_assert(std::is_standard_layout_v<Relation>);
    static_assert(std::is_trivially_copyable_v<TemporalFact>);

} // namespace kairos::core
