#include "kairos/core/errors.hpp"

#include <cstdio>

namespace kairos::core {

    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Busy: return "Busy";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::InvalidInterval: return "InvalidInterval";
            case StatusCode::InvalidRegion: return "InvalidRegion";
            case StatusCode::InvalidRelationType: return "InvalidRelationType";
            case StatusCode::RenderSkipped: return "RenderSkipped";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Db: return "Db";
            case StatusDomain::Temporal: return "Temporal";
            case StatusDomain::Relation: return "Relation";
            case StatusDomain::Inference: return "Inference";
            case StatusDomain::Segment: return "Segment";
            case StatusDomain::Narrative: return "Narrative";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::Bindings: return "Bindings";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }

    u32 format_status(Status s, char* out, u32 out_size) noexcept {
        if (out == nullptr || out_size == 0) {
            return 0;
        }

        int len = std::snprintf(out, out_size, "%s/%s",
                                status_domain_name(s.domain),
                                status_code_name(s.code));
        auto append = [&](const char* fmt, auto... args) {
            if (len < 0 || static_cast<u32>(len) >= out_size) {
                return;
            }
            const int n = std::snprintf(out + len, out_size - static_cast<u32>(len), fmt, args...);
            if (n > 0) {
                len += n;
            }
        };

        if (s.scope.is_valid()) {
            append(" scope=%u", static_cast<unsigned>(s.scope.v));
        }
        if (s.fact.is_valid()) {
            append(" fact=%llu", static_cast<unsigned long long>(s.fact.v));
        }
        if (s.owner.id.is_valid()) {
            append(" owner=%s:%llu", entity_kind_name(s.owner.kind),
                   static_cast<unsigned long long>(s.owner.id.v));
        }
        if (s.aux != 0) {
            append(" aux=%u", static_cast<unsigned>(s.aux));
        }

        if (len < 0) {
            out[0] = '\0';
            return 0;
        }
        if (static_cast<u32>(len) >= out_size) {
            return out_size - 1;
        }
        return static_cast<u32>(len);
    }

} // namespace kairos::core
