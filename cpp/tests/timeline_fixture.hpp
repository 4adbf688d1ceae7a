#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "kairos/core/time.hpp"
#include "kairos/db/db.hpp"
#include "kairos/temporal/timeline_service.hpp"

namespace kairos::test_support {

    using namespace kairos::core;
    using namespace kairos::temporal;

    // 2024-01-01 at hh:mm UTC.
    inline Timestamp at(u32 hh, u32 mm = 0) {
        return make_timestamp(2024, 1, 1, hh, mm);
    }

    // Fresh in-memory store, catalogue resolver and service per test.
    class TimelineFixture : public ::testing::Test {
    protected:
        void SetUp() override {
            db::DbConfig cfg{};
            ASSERT_TRUE(is_ok(db::SqliteFactStore::open(cfg, &store_)));
            service_ = std::make_unique<TimelineService>(*store_, resolver_, config());
        }

        virtual TimelineConfig config() const { return TimelineConfig{}; }

        void describe(EntityKind kind, u64 id, const std::string& description,
                      std::optional<u32> actor = std::nullopt) {
            EntityInfo info;
            info.description = description;
            if (actor.has_value()) {
                info.actor = ActorId{*actor};
            }
            resolver_.put(OwnerRef{kind, EntityId{id}}, std::move(info));
        }

        FactId event(u64 id, Timestamp start, std::optional<Timestamp> end = std::nullopt,
                     Granularity g = Granularity::Minutes) {
            return fact(EntityKind::Event, id, start, end, g);
        }

        // Registers the owner if needed, then upserts the fact into kScope.
        FactId fact(EntityKind kind, u64 id, Timestamp start, std::optional<Timestamp> end = std::nullopt,
                    Granularity g = Granularity::Minutes, RegionType region = RegionType::Instant) {
            const OwnerRef owner{kind, EntityId{id}};
            EntityInfo existing;
            if (!is_ok(resolver_.resolve(owner, &existing))) {
                describe(kind, id, std::string(entity_kind_name(kind)) + " " + std::to_string(id));
            }
            FactParams p;
            p.owner = owner;
            p.scope = kScope;
            p.region = end.has_value() ? RegionType::Interval : region;
            p.start = start;
            p.end = end;
            p.granularity = g;
            FactId out{};
            const Status s = service_->store().upsert_fact(p, &out);
            EXPECT_TRUE(is_ok(s));
            return out;
        }

        TemporalFact get(FactId id) {
            TemporalFact f;
            EXPECT_TRUE(is_ok(service_->store().get_fact(id, &f)));
            return f;
        }

        static constexpr ScopeId kScope{1};

        std::unique_ptr<db::SqliteFactStore> store_;
        CatalogEntityResolver resolver_;
        std::unique_ptr<TimelineService> service_;
    };

} // namespace kairos::test_support
