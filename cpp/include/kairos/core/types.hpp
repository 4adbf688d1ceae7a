#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace kairos::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Seconds since the Unix epoch, UTC.
    using Timestamp = i64;

    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    struct FactIdTag {};
    using FactId = Id<FactIdTag, u64>;

    struct ScopeIdTag {};
    using ScopeId = Id<ScopeIdTag, u32>;

    struct EntityIdTag {};
    using EntityId = Id<EntityIdTag, u64>;

    struct ActorIdTag {};
    using ActorId = Id<ActorIdTag, u32>;

    enum class EntityKind : u8 {
        Event = 0,
        Action = 1,
        Decision = 2,
    };

    inline constexpr u32 kEntityKindCount = 3;

    // Which domain object a temporal fact describes.
    struct OwnerRef {
        EntityKind kind{EntityKind::Event};
        EntityId id{EntityId::invalid()};

        friend constexpr bool operator==(OwnerRef, OwnerRef) noexcept = default;
        friend constexpr auto operator<=>(OwnerRef, OwnerRef) noexcept = default;
    };

    enum class RegionType : u8 {
        Instant = 0,
        Interval = 1,
    };

    enum class Granularity : u8 {
        Seconds = 0,
        Minutes = 1,
        Hours = 2,
        Days = 3,
        Weeks = 4,
        Months = 5,
        Years = 6,
    };

    // Lowercase wire names: "event", "action", "decision".
    const char* entity_kind_name(EntityKind k) noexcept;
    [[nodiscard]] bool entity_kind_parse(const char* name, EntityKind* out) noexcept;

    const char* region_type_name(RegionType r) noexcept;
    [[nodiscard]] bool region_type_parse(const char* name, RegionType* out) noexcept;

    const char* granularity_name(Granularity g) noexcept;
    [[nodiscard]] bool granularity_parse(const char* name, Granularity* out) noexcept;

    static_assert(sizeof(FactId) == 8);
    static_assert(sizeof(ScopeId) == 4);
    static_assert(std::is_trivially_copyable_v<OwnerRef>);
    static_assert(std::is_standard_layout_v<OwnerRef>);

} // namespace kairos::core
