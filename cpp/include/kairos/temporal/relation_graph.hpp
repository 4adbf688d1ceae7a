#pragma once
#include <vector>

#include "kairos/core/errors.hpp"
#include "kairos/core/models.hpp"
#include "kairos/core/relation.hpp"
#include "kairos/db/db.hpp"

namespace kairos::temporal {

    using kairos::core::FactId;
    using kairos::core::RelationType;
    using kairos::core::Status;
    using kairos::core::TemporalFact;

    // Typed relations between facts. Each fact stores at most one outgoing
    // relation; writes are last-write-wins.
    class RelationGraph {
    public:
        explicit RelationGraph(db::FactStore& store) noexcept : store_(store) {}

        // Sets from.relation = (type, to). When the type has an inverse,
        // also sets to.relation = (inverse, from), replacing whatever the
        // target held. InvalidRelationType for None, NotFound when either
        // endpoint is missing, Invalid for a self relation or a confidence
        // outside [0, 1].
        Status create_relation(FactId from, FactId to, RelationType type,
                               float confidence = core::kAssertedConfidence) noexcept;

        // Every f such that "fact <type> f": the target of fact's own
        // relation when it has this type, plus each f holding
        // (inverse(type), fact). Types without an inverse only have the own
        // edge. Ascending by (start, id), the own target last if it lives in
        // another scope. An empty result is not an error.
        Status find_related(FactId fact, RelationType type, std::vector<TemporalFact>* out) noexcept;

    private:
        db::FactStore& store_;
    };

} // namespace kairos::temporal
