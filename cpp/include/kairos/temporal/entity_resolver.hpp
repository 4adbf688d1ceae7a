#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "kairos/core/errors.hpp"
#include "kairos/core/types.hpp"

namespace kairos::temporal {

    using kairos::core::ActorId;
    using kairos::core::OwnerRef;
    using kairos::core::Status;

    struct DecisionOption {
        std::string label;
        std::string description;
    };

    // What the host application knows about the entity a fact belongs to.
    struct EntityInfo {
        std::string description;
        std::optional<ActorId> actor{};
        // Decisions only.
        std::vector<DecisionOption> options{};
        std::optional<std::string> selected_option{};
        std::vector<std::string> ethical_principles{};
    };

    // Maps an owner reference to its description and owning actor.
    // Returns NotFound when the owner is unknown.
    class EntityResolver {
    public:
        virtual ~EntityResolver() = default;
        virtual Status resolve(const OwnerRef& owner, EntityInfo* out) noexcept = 0;
    };

    // In-memory resolver fed by the host (or by a JSON catalogue in the CLI).
    class CatalogEntityResolver final : public EntityResolver {
    public:
        void put(const OwnerRef& owner, EntityInfo info);
        bool erase(const OwnerRef& owner) noexcept;
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

        Status resolve(const OwnerRef& owner, EntityInfo* out) noexcept override;

    private:
        std::map<OwnerRef, EntityInfo> entries_;
    };

} // namespace kairos::temporal
