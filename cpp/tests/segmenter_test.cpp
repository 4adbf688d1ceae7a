#include <gtest/gtest.h>

#include "kairos/temporal/segmenter.hpp"
#include "timeline_fixture.hpp"

using namespace kairos::test_support;

namespace {

class SegmenterTest : public TimelineFixture {
protected:
    std::vector<Segment> group(SegmentStrategy strategy, const SegmentParams& params = {}) {
        std::vector<Segment> out;
        EXPECT_TRUE(is_ok(service_->segmenter().group(kScope, strategy, params, &out)));
        return out;
    }
};

} // namespace

TEST(SegmentStrategyNames, RoundTrip) {
    for (const char* name : {"by_actor", "by_gap", "by_kind", "auto"}) {
        SegmentStrategy s{};
        ASSERT_TRUE(segment_strategy_parse(name, &s));
        EXPECT_STREQ(segment_strategy_name(s), name);
    }
    SegmentStrategy s{};
    EXPECT_FALSE(segment_strategy_parse("by_day", &s));
}

//=============================================================================
// by_gap
//=============================================================================

TEST_F(SegmenterTest, GapSplitsAtThreshold) {
    const FactId a = event(1, at(9));
    const FactId b = event(2, at(9, 10));
    const FactId c = event(3, at(11, 15));

    SegmentParams params;
    params.gap_threshold_seconds = 3600;
    const auto segs = group(SegmentStrategy::ByGap, params);
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0].key, "segment_0");
    ASSERT_EQ(segs[0].facts.size(), 2u);
    EXPECT_EQ(segs[0].facts[0].id, a);
    EXPECT_EQ(segs[0].facts[1].id, b);
    EXPECT_EQ(segs[1].key, "segment_1");
    ASSERT_EQ(segs[1].facts.size(), 1u);
    EXPECT_EQ(segs[1].facts[0].id, c);
}

TEST_F(SegmenterTest, GapEqualToThresholdStaysTogether) {
    event(1, at(9));
    event(2, at(10));
    EXPECT_EQ(group(SegmentStrategy::ByGap).size(), 1u);
}

TEST_F(SegmenterTest, ZeroGapSplitsDistinctStarts) {
    event(1, at(9));
    event(2, at(9));
    event(3, at(9, 1));
    SegmentParams params;
    params.gap_threshold_seconds = 0;
    const auto segs = group(SegmentStrategy::ByGap, params);
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0].facts.size(), 2u);
}

TEST_F(SegmenterTest, GapWalksByStartAfterFactMoves) {
    event(1, at(9));
    event(2, at(10));
    ASSERT_TRUE(is_ok(service_->inference().recompute_timeline_order(kScope)));
    event(1, at(11));

    const auto segs = group(SegmentStrategy::ByGap);
    ASSERT_EQ(segs.size(), 1u);
    ASSERT_EQ(segs[0].facts.size(), 2u);
    EXPECT_EQ(segs[0].facts[0].start, at(10));
    EXPECT_EQ(segs[0].facts[1].start, at(11));
}

TEST_F(SegmenterTest, NegativeGapIsInvalid) {
    SegmentParams params;
    params.gap_threshold_seconds = -1;
    std::vector<Segment> out;
    const Status s = service_->segmenter().group(kScope, SegmentStrategy::ByGap, params, &out);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.scope, kScope);
}

//=============================================================================
// by_actor
//=============================================================================

TEST_F(SegmenterTest, ActorBucketsInFirstAppearanceOrder) {
    describe(EntityKind::Event, 1, "Alarm", 7);
    describe(EntityKind::Action, 2, "Call supervisor", 3);
    describe(EntityKind::Event, 3, "Weather");
    describe(EntityKind::Decision, 4, "Evacuate", 7);
    const FactId a = event(1, at(9));
    const FactId b = fact(EntityKind::Action, 2, at(10));
    const FactId c = event(3, at(11));
    const FactId d = fact(EntityKind::Decision, 4, at(12));

    const auto segs = group(SegmentStrategy::ByActor);
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[0].key, "7");
    ASSERT_EQ(segs[0].facts.size(), 2u);
    EXPECT_EQ(segs[0].facts[0].id, a);
    EXPECT_EQ(segs[0].facts[1].id, d);
    EXPECT_EQ(segs[1].key, "3");
    EXPECT_EQ(segs[1].facts[0].id, b);
    EXPECT_EQ(segs[2].key, "unassigned");
    EXPECT_EQ(segs[2].facts[0].id, c);
}

TEST_F(SegmenterTest, UnresolvedOwnerIsUnassigned) {
    event(1, at(9));
    ASSERT_TRUE(resolver_.erase(OwnerRef{EntityKind::Event, EntityId{1}}));
    const auto segs = group(SegmentStrategy::ByActor);
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0].key, "unassigned");
}

//=============================================================================
// by_kind
//=============================================================================

TEST_F(SegmenterTest, KindAlwaysHasThreeBuckets) {
    const FactId e = event(1, at(9));
    const FactId d = fact(EntityKind::Decision, 2, at(10));

    const auto segs = group(SegmentStrategy::ByKind);
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[0].key, "events");
    EXPECT_EQ(segs[1].key, "actions");
    EXPECT_EQ(segs[2].key, "decisions");
    ASSERT_EQ(segs[0].facts.size(), 1u);
    EXPECT_EQ(segs[0].facts[0].id, e);
    EXPECT_TRUE(segs[1].facts.empty());
    EXPECT_EQ(segs[2].facts[0].id, d);
}

TEST_F(SegmenterTest, KindOnEmptyScope) {
    const auto segs = group(SegmentStrategy::ByKind);
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_TRUE(segs[0].facts.empty());
}

//=============================================================================
// auto
//=============================================================================

TEST_F(SegmenterTest, AutoBatchesOfFive) {
    for (u64 i = 1; i <= 12; ++i) {
        event(i, at(8) + static_cast<Timestamp>(i) * 600);
    }
    const auto segs = group(SegmentStrategy::Auto);
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[0].key, "batch_0");
    EXPECT_EQ(segs[0].facts.size(), 5u);
    EXPECT_EQ(segs[1].facts.size(), 5u);
    EXPECT_EQ(segs[2].key, "batch_2");
    EXPECT_EQ(segs[2].facts.size(), 2u);
    EXPECT_EQ(segs[2].facts[1].owner.id, EntityId{12});
}

TEST_F(SegmenterTest, AutoEmptyScopeHasNoSegments) {
    EXPECT_TRUE(group(SegmentStrategy::Auto).empty());
}

TEST_F(SegmenterTest, ZeroBatchIsInvalid) {
    SegmentParams params;
    params.batch_size = 0;
    std::vector<Segment> out;
    EXPECT_EQ(service_->segmenter().group(kScope, SegmentStrategy::Auto, params, &out).code, StatusCode::Invalid);
}

//=============================================================================
// Ordering
//=============================================================================

TEST(SortForTimeline, UsesTimelineOrderWhenComplete) {
    TemporalFact a;
    a.id = FactId{1};
    a.start = 100;
    a.timeline_order = 1;
    TemporalFact b;
    b.id = FactId{2};
    b.start = 200;
    b.timeline_order = 0;

    std::vector<TemporalFact> facts{a, b};
    sort_for_timeline(&facts);
    EXPECT_EQ(facts[0].id, FactId{2});

    facts[0].timeline_order = -1;
    sort_for_timeline(&facts);
    EXPECT_EQ(facts[0].id, FactId{1});
}

TEST_F(SegmenterTest, DeterministicAfterReorder) {
    for (u64 i = 1; i <= 7; ++i) {
        event(i, at(9) + static_cast<Timestamp>(i % 3) * 60);
    }
    ASSERT_TRUE(is_ok(service_->inference().recompute_timeline_order(kScope)));
    const auto first = group(SegmentStrategy::Auto);
    const auto second = group(SegmentStrategy::Auto);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t s = 0; s < first.size(); ++s) {
        ASSERT_EQ(first[s].facts.size(), second[s].facts.size());
        for (std::size_t i = 0; i < first[s].facts.size(); ++i) {
            EXPECT_EQ(first[s].facts[i].id, second[s].facts[i].id);
        }
    }
}
