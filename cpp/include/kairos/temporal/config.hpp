#pragma once

#include <type_traits>

#include "kairos/core/types.hpp"

namespace kairos::temporal {

    struct TemporalStoreConfig {
        // When false, an Interval without an end fails with InvalidInterval.
        bool allow_open_intervals{true};
    };

    struct InferenceConfig {
        float inferred_confidence{0.8f};   // must stay below 1.0
    };

    struct SegmenterConfig {
        core::i64 gap_threshold_seconds{3600};
        core::u32 batch_size{5};
    };

    // Defaults for get_context when the caller does not say otherwise.
    struct NarratorConfig {
        bool include_confidence{false};
        bool include_causal{false};
    };

    struct TimelineConfig {
        TemporalStoreConfig store{};
        InferenceConfig inference{};
        SegmenterConfig segmenter{};
        NarratorConfig narrator{};
    };

    static_assert(std::is_trivially_copyable_v<TimelineConfig>);

} // namespace kairos::temporal
