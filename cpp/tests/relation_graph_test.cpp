#include <gtest/gtest.h>

#include "kairos/temporal/relation_graph.hpp"
#include "timeline_fixture.hpp"

using namespace kairos::test_support;

namespace {
class RelationGraphTest : public TimelineFixture {};
}

//=============================================================================
// create_relation
//=============================================================================

TEST_F(RelationGraphTest, PrecedesWritesFollowsInverse) {
    const FactId a = event(1, at(9));
    const FactId b = event(2, at(10));
    ASSERT_TRUE(is_ok(service_->relations().create_relation(a, b, RelationType::Precedes)));

    std::vector<TemporalFact> related;
    ASSERT_TRUE(is_ok(service_->relations().find_related(b, RelationType::Follows, &related)));
    ASSERT_EQ(related.size(), 1u);
    EXPECT_EQ(related[0].id, a);

    ASSERT_TRUE(is_ok(service_->relations().find_related(a, RelationType::Precedes, &related)));
    ASSERT_EQ(related.size(), 1u);
    EXPECT_EQ(related[0].id, b);

    // Only one direction answers: b does not precede a.
    ASSERT_TRUE(is_ok(service_->relations().find_related(b, RelationType::Precedes, &related)));
    EXPECT_TRUE(related.empty());
    ASSERT_TRUE(is_ok(service_->relations().find_related(a, RelationType::Follows, &related)));
    EXPECT_TRUE(related.empty());
}

TEST_F(RelationGraphTest, CoincidesWithIsSymmetric) {
    const FactId a = event(1, at(9));
    const FactId b = event(2, at(9));
    ASSERT_TRUE(is_ok(service_->relations().create_relation(a, b, RelationType::CoincidesWith)));

    const TemporalFact fa = get(a);
    const TemporalFact fb = get(b);
    ASSERT_TRUE(fa.relation.has_value());
    ASSERT_TRUE(fb.relation.has_value());
    EXPECT_EQ(fa.relation->type, RelationType::CoincidesWith);
    EXPECT_EQ(fa.relation->target, b);
    EXPECT_EQ(fb.relation->type, RelationType::CoincidesWith);
    EXPECT_EQ(fb.relation->target, a);
    EXPECT_FALSE(relation_is_inferred(*fa.relation));

    std::vector<TemporalFact> related;
    ASSERT_TRUE(is_ok(service_->relations().find_related(a, RelationType::CoincidesWith, &related)));
    ASSERT_EQ(related.size(), 1u);
    EXPECT_EQ(related[0].id, b);
}

TEST_F(RelationGraphTest, CausalAnnotationsHaveNoInverse) {
    const FactId a = event(1, at(9));
    const FactId b = event(2, at(10));
    ASSERT_TRUE(is_ok(service_->relations().create_relation(b, a, RelationType::CausedBy)));

    EXPECT_FALSE(get(a).relation.has_value());
    const TemporalFact fb = get(b);
    ASSERT_TRUE(fb.relation.has_value());
    EXPECT_EQ(fb.relation->type, RelationType::CausedBy);

    std::vector<TemporalFact> related;
    ASSERT_TRUE(is_ok(service_->relations().find_related(b, RelationType::CausedBy, &related)));
    ASSERT_EQ(related.size(), 1u);
    EXPECT_EQ(related[0].id, a);
    ASSERT_TRUE(is_ok(service_->relations().find_related(a, RelationType::CausedBy, &related)));
    EXPECT_TRUE(related.empty());
}

TEST_F(RelationGraphTest, InverseOverwritesTargetRelation) {
    const FactId a = event(1, at(9));
    const FactId b = event(2, at(10));
    const FactId c = event(3, at(11));
    ASSERT_TRUE(is_ok(service_->relations().create_relation(b, c, RelationType::Precedes)));
    ASSERT_TRUE(is_ok(service_->relations().create_relation(a, b, RelationType::Precedes)));

    const TemporalFact fb = get(b);
    ASSERT_TRUE(fb.relation.has_value());
    EXPECT_EQ(fb.relation->type, RelationType::Follows);
    EXPECT_EQ(fb.relation->target, a);
}

TEST_F(RelationGraphTest, SecondRelationReplacesFirst) {
    const FactId a = event(1, at(9));
    const FactId b = event(2, at(10));
    const FactId c = event(3, at(11));
    ASSERT_TRUE(is_ok(service_->relations().create_relation(a, b, RelationType::Precedes)));
    ASSERT_TRUE(is_ok(service_->relations().create_relation(a, c, RelationType::HasConsequence)));

    const TemporalFact fa = get(a);
    ASSERT_TRUE(fa.relation.has_value());
    EXPECT_EQ(fa.relation->type, RelationType::HasConsequence);
    EXPECT_EQ(fa.relation->target, c);
    EXPECT_EQ(get(c).relation->type, RelationType::IsConsequenceOf);
}

TEST_F(RelationGraphTest, KeepsGivenConfidence) {
    const FactId a = event(1, at(9));
    const FactId b = event(2, at(10));
    ASSERT_TRUE(is_ok(service_->relations().create_relation(a, b, RelationType::Overlaps, 0.82f)));
    EXPECT_FLOAT_EQ(get(a).relation->confidence, 0.82f);
    EXPECT_FLOAT_EQ(get(b).relation->confidence, 0.82f);
    EXPECT_TRUE(relation_is_inferred(*get(a).relation));
}

//=============================================================================
// Failures
//=============================================================================

TEST_F(RelationGraphTest, NoneIsInvalidRelationType) {
    const FactId a = event(1, at(9));
    const FactId b = event(2, at(10));
    const Status s = service_->relations().create_relation(a, b, RelationType::None);
    EXPECT_EQ(s.code, StatusCode::InvalidRelationType);
    EXPECT_EQ(s.fact, a);
    EXPECT_EQ(s.scope, kScope);
    EXPECT_FALSE(get(a).relation.has_value());
}

TEST_F(RelationGraphTest, MissingEndpointIsNotFoundAndWritesNothing) {
    const FactId a = event(1, at(9));
    const Status s = service_->relations().create_relation(a, FactId{999}, RelationType::Precedes);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.fact, FactId{999});
    EXPECT_EQ(s.scope, kScope);
    EXPECT_FALSE(get(a).relation.has_value());

    EXPECT_EQ(service_->relations().create_relation(FactId{999}, a, RelationType::Precedes).code,
              StatusCode::NotFound);
}

TEST_F(RelationGraphTest, SelfRelationAndBadConfidenceAreInvalid) {
    const FactId a = event(1, at(9));
    const FactId b = event(2, at(10));
    EXPECT_EQ(service_->relations().create_relation(a, a, RelationType::CoincidesWith).code, StatusCode::Invalid);
    const Status s = service_->relations().create_relation(a, b, RelationType::Precedes, 1.2f);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.scope, kScope);
}

//=============================================================================
// find_related
//=============================================================================

TEST_F(RelationGraphTest, FindRelatedEmptyIsNotAnError) {
    const FactId a = event(1, at(9));
    std::vector<TemporalFact> related;
    ASSERT_TRUE(is_ok(service_->relations().find_related(a, RelationType::Precedes, &related)));
    EXPECT_TRUE(related.empty());
}

TEST_F(RelationGraphTest, FindRelatedFailures) {
    const FactId a = event(1, at(9));
    std::vector<TemporalFact> related;
    EXPECT_EQ(service_->relations().find_related(FactId{404}, RelationType::Precedes, &related).code,
              StatusCode::NotFound);
    const Status s = service_->relations().find_related(a, RelationType::None, &related);
    EXPECT_EQ(s.code, StatusCode::InvalidRelationType);
    EXPECT_EQ(s.fact, a);
    EXPECT_EQ(s.scope, kScope);
}

TEST_F(RelationGraphTest, FindRelatedCollectsAllPredecessors) {
    const FactId target = event(1, at(12));
    const FactId x = event(2, at(9));
    const FactId y = event(3, at(10));
    ASSERT_TRUE(is_ok(service_->relations().create_relation(x, target, RelationType::Precedes)));
    ASSERT_TRUE(is_ok(service_->relations().create_relation(y, target, RelationType::Precedes)));

    // target now holds (follows, y) only; x is found through its own edge.
    std::vector<TemporalFact> related;
    ASSERT_TRUE(is_ok(service_->relations().find_related(target, RelationType::Follows, &related)));
    ASSERT_EQ(related.size(), 2u);
    EXPECT_EQ(related[0].id, x);
    EXPECT_EQ(related[1].id, y);
}

TEST_F(RelationGraphTest, FindRelatedFollowsEdgeAcrossScopes) {
    const FactId a = event(1, at(9));
    describe(EntityKind::Event, 50, "Elsewhere");
    FactParams p;
    p.owner = OwnerRef{EntityKind::Event, EntityId{50}};
    p.scope = ScopeId{2};
    p.start = at(8);
    FactId other{};
    ASSERT_TRUE(is_ok(service_->store().upsert_fact(p, &other)));
    ASSERT_TRUE(is_ok(service_->relations().create_relation(a, other, RelationType::EnabledBy)));

    std::vector<TemporalFact> related;
    ASSERT_TRUE(is_ok(service_->relations().find_related(a, RelationType::EnabledBy, &related)));
    ASSERT_EQ(related.size(), 1u);
    EXPECT_EQ(related[0].id, other);
    EXPECT_EQ(related[0].scope, ScopeId{2});
}
