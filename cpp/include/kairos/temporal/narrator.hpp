#pragma once
#include <optional>
#include <string>
#include <vector>

#include "kairos/core/errors.hpp"
#include "kairos/core/models.hpp"
#include "kairos/db/db.hpp"
#include "kairos/temporal/config.hpp"
#include "kairos/temporal/entity_resolver.hpp"

namespace kairos::temporal {

    using kairos::core::EntityId;
    using kairos::core::EntityKind;
    using kairos::core::FactId;
    using kairos::core::ScopeId;
    using kairos::core::Status;
    using kairos::core::Timestamp;
    using kairos::core::u32;

    struct TimelineEntry {
        FactId fact{FactId::invalid()};
        EntityKind kind{EntityKind::Event};
        EntityId entity{EntityId::invalid()};
        Timestamp start{0};
        std::optional<Timestamp> end{};
        std::string description;
        std::optional<ActorId> actor{};
        std::string relation_summary;   // "" when the fact has no relation
        std::vector<DecisionOption> options{};
        std::optional<std::string> selected_option{};
        std::vector<std::string> ethical_principles{};
    };

    struct Timeline {
        ScopeId scope{ScopeId::invalid()};
        std::vector<TimelineEntry> events;
        std::vector<TimelineEntry> actions;
        std::vector<TimelineEntry> decisions;
    };

    struct ContextOptions {
        bool include_confidence{false};
        bool include_causal{false};
    };

    struct RenderStats {
        u32 facts{0};
        u32 relations{0};
        u32 skipped{0};   // relation lines dropped because an endpoint did not resolve
    };

    // Read-only presentation of a scope. Rendering never fails because of a
    // single unresolved entity; such lines are skipped and logged.
    class Narrator {
    public:
        Narrator(db::FactStore& store, EntityResolver& resolver, const NarratorConfig& cfg = {}) noexcept
            : store_(store), resolver_(resolver), cfg_(cfg) {}

        // NotFound when the scope does not exist.
        Status build_timeline(ScopeId scope, Timeline* out) noexcept;

        // TIMELINE, TEMPORAL RELATIONSHIPS and optionally CAUSAL
        // RELATIONSHIPS sections. NotFound when the scope does not exist.
        Status get_context(ScopeId scope, const ContextOptions& opts, std::string* out,
                           RenderStats* stats = nullptr) noexcept;
        Status get_context(ScopeId scope, std::string* out) noexcept;

        // "happens before", "leads to", ...; nullptr for None.
        static const char* relation_phrase(core::RelationType type) noexcept;

        [[nodiscard]] const NarratorConfig& config() const noexcept { return cfg_; }

    private:
        db::FactStore& store_;
        EntityResolver& resolver_;
        NarratorConfig cfg_;
    };

} // namespace kairos::temporal
