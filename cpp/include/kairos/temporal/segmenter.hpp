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

    using kairos::core::i64;
    using kairos::core::ScopeId;
    using kairos::core::Status;
    using kairos::core::TemporalFact;
    using kairos::core::u32;

    enum class SegmentStrategy : core::u8 {
        ByActor = 0,
        ByGap,
        ByKind,
        Auto,
    };

    // Wire names: "by_actor", "by_gap", "by_kind", "auto".
    const char* segment_strategy_name(SegmentStrategy s) noexcept;
    [[nodiscard]] bool segment_strategy_parse(const char* name, SegmentStrategy* out) noexcept;

    // Unset fields fall back to SegmenterConfig.
    struct SegmentParams {
        std::optional<i64> gap_threshold_seconds{};
        std::optional<u32> batch_size{};
    };

    struct Segment {
        std::string key;
        std::vector<TemporalFact> facts;
    };

    // Orders facts by timeline_order when every fact carries one, otherwise
    // by (start, id). Both Segmenter and Narrator present facts this way.
    void sort_for_timeline(std::vector<TemporalFact>* facts);

    class Segmenter {
    public:
        Segmenter(db::FactStore& store, EntityResolver& resolver, const SegmenterConfig& cfg = {}) noexcept
            : store_(store), resolver_(resolver), cfg_(cfg) {}

        // Segments come back in a deterministic order:
        //   by_actor  first appearance of each actor, "unassigned" included
        //   by_gap    "segment_0", "segment_1", ...
        //   by_kind   always "events", "actions", "decisions"
        //   auto      "batch_0", "batch_1", ...
        Status group(ScopeId scope, SegmentStrategy strategy, const SegmentParams& params,
                     std::vector<Segment>* out) noexcept;

        [[nodiscard]] const SegmenterConfig& config() const noexcept { return cfg_; }

    private:
        void group_by_actor(const std::vector<TemporalFact>& facts, std::vector<Segment>* out);
        static void group_by_gap(const std::vector<TemporalFact>& facts, i64 threshold, std::vector<Segment>* out);
        static void group_by_kind(const std::vector<TemporalFact>& facts, std::vector<Segment>* out);
        static void group_in_batches(const std::vector<TemporalFact>& facts, u32 batch, std::vector<Segment>* out);

        db::FactStore& store_;
        EntityResolver& resolver_;
        SegmenterConfig cfg_;
    };

} // namespace kairos::temporal
