#include "kairos/core/types.hpp"
#include "kairos/core/relation.hpp"

#include <cstring>

namespace kairos::core {
    namespace {
        constexpr const char* kEntityKindNames[] = {"event", "action", "decision"};
        constexpr const char* kRegionTypeNames[] = {"instant", "interval"};
        constexpr const char* kGranularityNames[] = {
            "seconds", "minutes", "hours", "days", "weeks", "months", "years",
        };
        constexpr const char* kRelationTypeNames[] = {
            "none",
            "precedes",
            "follows",
            "coincidesWith",
            "overlaps",
            "necessitates",
            "isNecessitatedBy",
            "hasConsequence",
            "isConsequenceOf",
            "causedBy",
            "enabledBy",
            "preventedBy",
        };

        static_assert(sizeof(kEntityKindNames) / sizeof(kEntityKindNames[0]) == kEntityKindCount);
        static_assert(sizeof(kRelationTypeNames) / sizeof(kRelationTypeNames[0]) == kRelationTypeCount);

        template <typename E, size_t N>
        [[nodiscard]] bool parse_by_table(const char* const (&table)[N], const char* name, E* out) noexcept {
            if (name == nullptr || out == nullptr) {
                return false;
            }
            for (size_t i = 0; i < N; ++i) {
                if (std::strcmp(table[i], name) == 0) {
                    *out = static_cast<E>(i);
                    return true;
                }
            }
            return false;
        }
    } // namespace

    const char* entity_kind_name(EntityKind k) noexcept {
        const auto i = static_cast<u32>(k);
        return i < kEntityKindCount ? kEntityKindNames[i] : "unknown";
    }

    bool entity_kind_parse(const char* name, EntityKind* out) noexcept {
        return parse_by_table(kEntityKindNames, name, out);
    }

    const char* region_type_name(RegionType r) noexcept {
        const auto i = static_cast<u32>(r);
        return i < 2 ? kRegionTypeNames[i] : "unknown";
    }

    bool region_type_parse(const char* name, RegionType* out) noexcept {
        return parse_by_table(kRegionTypeNames, name, out);
    }

    const char* granularity_name(Granularity g) noexcept {
        const auto i = static_cast<u32>(g);
        return i < 7 ? kGranularityNames[i] : "unknown";
    }

    bool granularity_parse(const char* name, Granularity* out) noexcept {
        return parse_by_table(kGranularityNames, name, out);
    }

    const char* relation_type_name(RelationType t) noexcept {
        const auto i = static_cast<u32>(t);
        return i < kRelationTypeCount ? kRelationTypeNames[i] : "unknown";
    }

    RelationType relation_type_parse(const char* name) noexcept {
        RelationType t = RelationType::None;
        if (!parse_by_table(kRelationTypeNames, name, &t)) {
            return RelationType::None;
        }
        return t;
    }
} // namespace kairos::core
