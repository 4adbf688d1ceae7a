#pragma once
#include <cstdint>
#include <type_traits>

#include "kairos/core/types.hpp"

namespace kairos::core {

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Conflict,
        Busy,
        Corrupt,
        Io,
        Unsupported,
        Unavailable,
        InvalidInterval,
        InvalidRegion,
        InvalidRelationType,
        RenderSkipped,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Db,
        Temporal,
        Relation,
        Inference,
        Segment,
        Narrative,
        Cli,
        Bindings,
        External,
    };

    // Errors carry the scope and the offending fact/owner so a failed call
    // can be reproduced from the status alone.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
        ScopeId scope{ScopeId::invalid()};
        FactId fact{FactId::invalid()};
        OwnerRef owner{};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] constexpr Status with_scope(Status s, ScopeId scope) noexcept {
        s.scope = scope;
        return s;
    }

    [[nodiscard]] constexpr Status with_fact(Status s, FactId fact) noexcept {
        s.fact = fact;
        return s;
    }

    [[nodiscard]] constexpr Status with_owner(Status s, OwnerRef owner) noexcept {
        s.owner = owner;
        return s;
    }

    const char* status_code_name(StatusCode code) noexcept;
    const char* status_domain_name(StatusDomain domain) noexcept;

    // Writes "<Domain>/<Code>" plus any scope/fact/owner context into out.
    // Returns the number of characters written (excluding the terminator).
    u32 format_status(Status s, char* out, u32 out_size) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace kairos::core
