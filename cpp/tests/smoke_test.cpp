#include <cstring>

#include <gtest/gtest.h>

#include "kairos/core/errors.hpp"
#include "kairos/core/relation.hpp"
#include "kairos/core/types.hpp"

TEST(Status, DefaultIsOk){
    kairos::core::Status s{};
    EXPECT_EQ(s.code, kairos::core::StatusCode::Ok);
    EXPECT_EQ(s.domain, kairos::core::StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
    EXPECT_FALSE(s.scope.is_valid());
    EXPECT_FALSE(s.fact.is_valid());
}

TEST(Status, FormatCarriesScopeFactAndOwner) {
    using namespace kairos::core;
    Status s = make_status(StatusDomain::Temporal, StatusCode::InvalidInterval);
    s = with_scope(s, ScopeId{7});
    s = with_fact(s, FactId{42});
    s = with_owner(s, OwnerRef{EntityKind::Decision, EntityId{3}});

    char buf[128];
    const u32 n = format_status(s, buf, sizeof(buf));
    EXPECT_EQ(n, std::strlen(buf));
    EXPECT_STREQ(buf, "Temporal/InvalidInterval scope=7 fact=42 owner=decision:3");
}

TEST(Status, FormatTruncatesToBuffer) {
    using namespace kairos::core;
    const Status s = with_scope(make_status(StatusDomain::Narrative, StatusCode::RenderSkipped, 9), ScopeId{1});
    char buf[8];
    const u32 n = format_status(s, buf, sizeof(buf));
    EXPECT_EQ(n, 7u);
    EXPECT_STREQ(buf, "Narrati");
    EXPECT_EQ(format_status(s, nullptr, 0), 0u);
}

TEST(Types, EntityKindNamesRoundTrip) {
    using namespace kairos::core;
    for (const char* name : {"event", "action", "decision"}) {
        EntityKind k{};
        ASSERT_TRUE(entity_kind_parse(name, &k));
        EXPECT_STREQ(entity_kind_name(k), name);
    }
    EntityKind k{};
    EXPECT_FALSE(entity_kind_parse("Event", &k));
    EXPECT_FALSE(entity_kind_parse(nullptr, &k));
}

TEST(Types, GranularityParse) {
    using namespace kairos::core;
    Granularity g{};
    ASSERT_TRUE(granularity_parse("weeks", &g));
    EXPECT_EQ(g, Granularity::Weeks);
    EXPECT_FALSE(granularity_parse("fortnights", &g));
}

TEST(Relation, InverseTable) {
    using namespace kairos::core;
    EXPECT_EQ(relation_inverse(RelationType::Precedes), RelationType::Follows);
    EXPECT_EQ(relation_inverse(RelationType::Necessitates), RelationType::IsNecessitatedBy);
    EXPECT_EQ(relation_inverse(RelationType::IsConsequenceOf), RelationType::HasConsequence);
    EXPECT_TRUE(relation_is_symmetric(RelationType::CoincidesWith));
    EXPECT_TRUE(relation_is_symmetric(RelationType::Overlaps));
    EXPECT_FALSE(relation_has_inverse(RelationType::CausedBy));
    EXPECT_FALSE(relation_has_inverse(RelationType::EnabledBy));
    EXPECT_FALSE(relation_has_inverse(RelationType::PreventedBy));
    EXPECT_FALSE(relation_type_allowed(RelationType::None));
}

TEST(Relation, WireNames) {
    using namespace kairos::core;
    EXPECT_EQ(relation_type_parse("coincidesWith"), RelationType::CoincidesWith);
    EXPECT_EQ(relation_type_parse("isNecessitatedBy"), RelationType::IsNecessitatedBy);
    EXPECT_EQ(relation_type_parse("before"), RelationType::None);
    EXPECT_EQ(relation_type_parse(nullptr), RelationType::None);
    EXPECT_STREQ(relation_type_name(RelationType::HasConsequence), "hasConsequence");
}

TEST(Relation, CausalSet) {
    using namespace kairos::core;
    EXPECT_TRUE(relation_is_causal(RelationType::CausedBy));
    EXPECT_TRUE(relation_is_causal(RelationType::HasConsequence));
    EXPECT_FALSE(relation_is_causal(RelationType::IsConsequenceOf));
    EXPECT_FALSE(relation_is_causal(RelationType::Precedes));
}
