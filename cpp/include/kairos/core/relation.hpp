#pragma once

#include <type_traits>

#include "kairos/core/types.hpp"

namespace kairos::core {

    enum class RelationType : u8 {
        None = 0,
        Precedes,
        Follows,
        CoincidesWith,
        Overlaps,
        Necessitates,
        IsNecessitatedBy,
        HasConsequence,
        IsConsequenceOf,
        CausedBy,
        EnabledBy,
        PreventedBy,
    };

    inline constexpr u32 kRelationTypeCount = 12;

    [[nodiscard]] constexpr bool relation_type_allowed(RelationType t) noexcept {
        return t != RelationType::None && static_cast<u32>(t) < kRelationTypeCount;
    }

    // Inverse maintained on the target fact. causedBy, enabledBy and
    // preventedBy are one-directional annotations and map to None.
    [[nodiscard]] constexpr RelationType relation_inverse(RelationType t) noexcept {
        switch (t) {
            case RelationType::Precedes: return RelationType::Follows;
            case RelationType::Follows: return RelationType::Precedes;
            case RelationType::CoincidesWith: return RelationType::CoincidesWith;
            case RelationType::Overlaps: return RelationType::Overlaps;
            case RelationType::Necessitates: return RelationType::IsNecessitatedBy;
            case RelationType::IsNecessitatedBy: return RelationType::Necessitates;
            case RelationType::HasConsequence: return RelationType::IsConsequenceOf;
            case RelationType::IsConsequenceOf: return RelationType::HasConsequence;
            default: return RelationType::None;
        }
    }

    [[nodiscard]] constexpr bool relation_has_inverse(RelationType t) noexcept {
        return relation_inverse(t) != RelationType::None;
    }

    [[nodiscard]] constexpr bool relation_is_symmetric(RelationType t) noexcept {
        return t != RelationType::None && relation_inverse(t) == t;
    }

    [[nodiscard]] constexpr bool relation_is_causal(RelationType t) noexcept {
        return t == RelationType::CausedBy || t == RelationType::EnabledBy ||
               t == RelationType::PreventedBy || t == RelationType::HasConsequence;
    }

    // Wire names ("precedes", "coincidesWith", ...).
    const char* relation_type_name(RelationType t) noexcept;

    // Returns RelationType::None for unknown names.
    RelationType relation_type_parse(const char* name) noexcept;

    static_assert(relation_inverse(RelationType::CausedBy) == RelationType::None);
    static_assert(relation_inverse(relation_inverse(RelationType::Precedes)) == RelationType::Precedes);

} // namespace kairos::core
