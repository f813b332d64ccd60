/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE EntityStoreTests
#include <boost/test/unit_test.hpp>

#include "entities/EntityStore.hpp"
#include <string>

using namespace FortressEngine;

namespace {

TransitEntity makeEntity(const std::string& id, float x, float y, float size = 10.0f,
                         TransitState state = TransitState::Scanning) {
    TransitEntity entity;
    entity.id = id;
    entity.position = Vector2D(x, y);
    entity.previousPosition = entity.position;
    entity.size = size;
    entity.state = state;
    return entity;
}

GrowthEntity makeGrowth(const std::string& sourceId) {
    GrowthEntity growth;
    growth.sourceId = sourceId;
    return growth;
}

} // namespace

struct EntityStoreFixture {
    EntityStore store{4, 3};
};

// ============================================================================
// TRANSIT ENTITIES
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TransitTests, EntityStoreFixture)

BOOST_AUTO_TEST_CASE(TestInsertAndFind) {
    BOOST_CHECK(store.insertTransit(makeEntity("a", 1.0f, 2.0f)));
    BOOST_CHECK(store.containsTransit("a"));
    BOOST_REQUIRE(store.findTransit("a") != nullptr);
    BOOST_CHECK_EQUAL(store.findTransit("a")->position.getX(), 1.0f);
    BOOST_CHECK(store.findTransit("b") == nullptr);
    BOOST_CHECK_EQUAL(store.snapshotStats().totalCreated, 1u);
}

BOOST_AUTO_TEST_CASE(TestDuplicateIdRejected) {
    store.insertTransit(makeEntity("a", 1.0f, 2.0f));
    BOOST_CHECK(!store.insertTransit(makeEntity("a", 99.0f, 99.0f)));
    BOOST_CHECK_EQUAL(store.getTransitCount(), 1u);
    BOOST_CHECK_EQUAL(store.findTransit("a")->position.getX(), 1.0f);
    BOOST_CHECK_EQUAL(store.snapshotStats().totalCreated, 1u);
}

BOOST_AUTO_TEST_CASE(TestInsertionOrderPreserved) {
    for (const char* id : {"c", "a", "b"}) {
        store.insertTransit(makeEntity(id, 0.0f, 0.0f));
    }
    const auto& transits = store.getTransits();
    BOOST_CHECK_EQUAL(transits[0].id, "c");
    BOOST_CHECK_EQUAL(transits[1].id, "a");
    BOOST_CHECK_EQUAL(transits[2].id, "b");
}

BOOST_AUTO_TEST_CASE(TestEvictsOldestDoneOnly) {
    store.insertTransit(makeEntity("live0", 0.0f, 0.0f));
    store.insertTransit(makeEntity("done1", 0.0f, 0.0f, 10.0f, TransitState::Done));
    store.insertTransit(makeEntity("done2", 0.0f, 0.0f, 10.0f, TransitState::Done));
    store.insertTransit(makeEntity("live3", 0.0f, 0.0f));
    BOOST_CHECK_EQUAL(store.getTransitCount(), 4u);

    store.insertTransit(makeEntity("live4", 0.0f, 0.0f));
    BOOST_CHECK_EQUAL(store.getTransitCount(), 4u);
    BOOST_CHECK(!store.containsTransit("done1"));
    BOOST_CHECK(store.containsTransit("done2"));
    BOOST_CHECK(store.containsTransit("live0"));

    // Index stays valid after compaction
    BOOST_CHECK_EQUAL(store.findTransit("live4")->id, "live4");
    BOOST_CHECK_EQUAL(store.findTransit("live3")->id, "live3");
}

BOOST_AUTO_TEST_CASE(TestCeilingMayBeExceededByLiveEntities) {
    for (int i = 0; i < 6; ++i) {
        store.insertTransit(makeEntity("n" + std::to_string(i), 0.0f, 0.0f));
    }
    BOOST_CHECK_EQUAL(store.getTransitCount(), 6u);
    BOOST_CHECK_EQUAL(store.getActiveTransitCount(), 6u);

    // Once some finish, the next insert trims back to the ceiling
    store.findTransit("n0")->state = TransitState::Done;
    store.findTransit("n1")->state = TransitState::Done;
    store.findTransit("n2")->state = TransitState::Done;
    store.insertTransit(makeEntity("n6", 0.0f, 0.0f));
    BOOST_CHECK_EQUAL(store.getTransitCount(), 4u);
    BOOST_CHECK(!store.containsTransit("n0"));
    BOOST_CHECK(!store.containsTransit("n2"));
    BOOST_CHECK(store.containsTransit("n3"));
}

BOOST_AUTO_TEST_CASE(TestClassificationCounters) {
    store.recordClassification(Classification::Flagged);
    store.recordClassification(Classification::Clear);
    store.recordClassification(Classification::Clear);
    store.recordClassification(Classification::Neutral);

    const PipelineStats stats = store.snapshotStats();
    BOOST_CHECK_EQUAL(stats.threatCount, 1u);
    BOOST_CHECK_EQUAL(stats.clearedCount, 2u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// HIT TESTING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(HitTestTests, EntityStoreFixture)

BOOST_AUTO_TEST_CASE(TestOverlapReturnsFirstInserted) {
    store.insertTransit(makeEntity("first", 100.0f, 100.0f));
    store.insertTransit(makeEntity("second", 104.0f, 100.0f));

    auto hit = store.hitTest(Vector2D(102.0f, 100.0f), 8.0f);
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_EQUAL(hit->id, "first");
    BOOST_CHECK_EQUAL(hit->entity.id, "first");
}

BOOST_AUTO_TEST_CASE(TestBoundaryIsExclusive) {
    store.insertTransit(makeEntity("e", 0.0f, 0.0f, 10.0f));
    BOOST_CHECK(store.hitTest(Vector2D(17.0f, 0.0f), 8.0f).has_value());
    BOOST_CHECK(!store.hitTest(Vector2D(18.0f, 0.0f), 8.0f).has_value());
    BOOST_CHECK(!store.hitTest(Vector2D(0.0f, 18.0f), 8.0f).has_value());
}

BOOST_AUTO_TEST_CASE(TestTerminalEntitiesIgnored) {
    store.insertTransit(makeEntity("gone", 50.0f, 50.0f, 10.0f, TransitState::Done));
    store.insertTransit(makeEntity("here", 52.0f, 50.0f));

    auto hit = store.hitTest(Vector2D(50.0f, 50.0f), 8.0f);
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_EQUAL(hit->id, "here");
}

BOOST_AUTO_TEST_CASE(TestHitReturnsDetachedCopy) {
    store.insertTransit(makeEntity("copy", 10.0f, 10.0f));
    auto hit = store.hitTest(Vector2D(10.0f, 10.0f), 8.0f);
    BOOST_REQUIRE(hit.has_value());
    hit->entity.position = Vector2D(-1.0f, -1.0f);
    BOOST_CHECK_EQUAL(store.findTransit("copy")->position.getX(), 10.0f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// GROWTH AND EFFECTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(GrowthAndEffectTests, EntityStoreFixture)

BOOST_AUTO_TEST_CASE(TestGrowthFifo) {
    for (const char* id : {"g1", "g2", "g3", "g4", "g5"}) {
        store.addGrowth(makeGrowth(id));
    }
    const auto& growths = store.getGrowths();
    BOOST_REQUIRE_EQUAL(growths.size(), 3u);
    BOOST_CHECK_EQUAL(growths[0].sourceId, "g3");
    BOOST_CHECK_EQUAL(growths[2].sourceId, "g5");
    BOOST_CHECK_EQUAL(store.snapshotStats().growthCount, 3u);
}

BOOST_AUTO_TEST_CASE(TestGrowthSlotsCycle) {
    BOOST_CHECK_EQUAL(store.claimGrowthSlot(3), 0u);
    BOOST_CHECK_EQUAL(store.claimGrowthSlot(3), 1u);
    BOOST_CHECK_EQUAL(store.claimGrowthSlot(3), 2u);
    BOOST_CHECK_EQUAL(store.claimGrowthSlot(3), 0u);
    BOOST_CHECK_EQUAL(store.claimGrowthSlot(0), 0u);
}

BOOST_AUTO_TEST_CASE(TestStageForAge) {
    BOOST_CHECK_EQUAL(GrowthEntity::stageForAge(0.0, 24.0), 0);
    BOOST_CHECK_EQUAL(GrowthEntity::stageForAge(5.9, 24.0), 0);
    BOOST_CHECK_EQUAL(GrowthEntity::stageForAge(6.0, 24.0), 1);
    BOOST_CHECK_EQUAL(GrowthEntity::stageForAge(12.5, 24.0), 2);
    BOOST_CHECK_EQUAL(GrowthEntity::stageForAge(18.0, 24.0), 3);
    BOOST_CHECK_EQUAL(GrowthEntity::stageForAge(500.0, 24.0), 3);
    BOOST_CHECK_EQUAL(GrowthEntity::stageForAge(-3.0, 24.0), 0);
}

BOOST_AUTO_TEST_CASE(TestEffectsPrunedWhenExpired) {
    TransientEffect pulse;
    pulse.startTime = 1.0;
    pulse.lifetime = 1.5;
    store.addPulse(pulse);

    TransientEffect burst;
    burst.startTime = 2.0;
    burst.lifetime = 1.5;
    store.addBurst(burst);

    BOOST_CHECK(store.getPulses().front().kind == EffectKind::Pulse);
    BOOST_CHECK(store.getBursts().front().kind == EffectKind::Burst);

    store.pruneExpiredEffects(2.4);
    BOOST_CHECK_EQUAL(store.getPulses().size(), 1u);
    store.pruneExpiredEffects(2.51);
    BOOST_CHECK(store.getPulses().empty());
    BOOST_CHECK_EQUAL(store.getBursts().size(), 1u);
    store.pruneExpiredEffects(3.5);
    BOOST_CHECK(store.getBursts().empty());
}

BOOST_AUTO_TEST_CASE(TestEffectProgress) {
    TransientEffect effect;
    effect.startTime = 10.0;
    effect.lifetime = 2.0;
    BOOST_CHECK_EQUAL(effect.progressAt(9.0), 0.0f);
    BOOST_CHECK_CLOSE(effect.progressAt(11.0), 0.5f, 0.001f);
    BOOST_CHECK_EQUAL(effect.progressAt(20.0), 1.0f);
}

BOOST_AUTO_TEST_CASE(TestClearResetsCollectionsButNotCounters) {
    store.insertTransit(makeEntity("a", 0.0f, 0.0f));
    store.addGrowth(makeGrowth("a"));
    store.recordClassification(Classification::Clear);
    store.clear();

    const PipelineStats stats = store.snapshotStats();
    BOOST_CHECK_EQUAL(store.getTransitCount(), 0u);
    BOOST_CHECK_EQUAL(stats.activeCount, 0u);
    BOOST_CHECK_EQUAL(stats.growthCount, 0u);
    BOOST_CHECK_EQUAL(stats.totalCreated, 1u);
    BOOST_CHECK_EQUAL(stats.clearedCount, 1u);
    BOOST_CHECK(!store.containsTransit("a"));
}

BOOST_AUTO_TEST_SUITE_END()
