/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE VisualizerHostTests
#include <boost/test/unit_test.hpp>

#include "host/VisualizerHost.hpp"
#include "../mocks/MockDrawSurface.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace FortressEngine;

namespace {
constexpr double STEP = 1.0 / 64.0;
}

struct HostFixture {
    MockRenderAdapter adapter;
    VisualizerHost host{SchedulerConfig{}, 800.0f, 500.0f, &adapter};
    double driverTime{0.0};

    HostFixture() {
        host.onFrame(driverTime);
    }

    void frames(int count) {
        for (int i = 0; i < count; ++i) {
            driverTime += STEP;
            host.onFrame(driverTime);
        }
    }

    TransitState stateOf(const std::string& id) const {
        auto entity = host.getScheduler().getEntity(id);
        BOOST_REQUIRE(entity.has_value());
        return entity->state;
    }
};

// ============================================================================
// INGESTION
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(IngestionTests, HostFixture)

BOOST_AUTO_TEST_CASE(TestInvalidTransactionsRejected) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    BOOST_CHECK(!host.submitTransaction("", 10.0, {}, "approve", 0.1));
    BOOST_CHECK(!host.submitTransaction("a", nan, {}, "approve", 0.1));
    BOOST_CHECK(!host.submitTransaction("a", -1.0, {}, "approve", 0.1));
    BOOST_CHECK(!host.submitTransaction("a", inf, {}, "approve", 0.1));
    BOOST_CHECK(!host.submitTransaction("a", 10.0, {}, "approve", inf));

    BOOST_CHECK_EQUAL(host.getScheduler().snapshotStats().totalCreated, 0u);
    BOOST_CHECK_EQUAL(host.getPendingClassificationCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestAcceptedTransactionCarriesDecision) {
    JsonObject metadata;
    metadata["txn_type"] = JsonValue("transfer");
    BOOST_CHECK(host.submitTransaction("t1", 120.0, metadata, "block", 0.9));

    auto entity = host.getScheduler().getEntity("t1");
    BOOST_REQUIRE(entity.has_value());
    BOOST_CHECK_EQUAL(entity->metadata.at("decision").asString(), "block");
    BOOST_CHECK_EQUAL(entity->metadata.at("txn_type").asString(), "transfer");
    BOOST_CHECK_EQUAL(host.getPendingClassificationCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestDuplicateIdNotRescheduled) {
    BOOST_CHECK(host.submitTransaction("dup", 50.0, {}, "approve", 0.2));
    BOOST_CHECK(!host.submitTransaction("dup", 75.0, {}, "block", 0.9));
    BOOST_CHECK_EQUAL(host.getPendingClassificationCount(), 1u);
    BOOST_CHECK_EQUAL(host.getScheduler().snapshotStats().totalCreated, 1u);
}

BOOST_AUTO_TEST_CASE(TestThreatDecisions) {
    BOOST_CHECK(VisualizerHost::isThreatDecision("review"));
    BOOST_CHECK(VisualizerHost::isThreatDecision("block"));
    BOOST_CHECK(!VisualizerHost::isThreatDecision("approve"));
    BOOST_CHECK(!VisualizerHost::isThreatDecision(""));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// DEFERRED CLASSIFICATION
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DeferredClassificationTests, HostFixture)

BOOST_AUTO_TEST_CASE(TestThreatAppliedAfterDelay) {
    BOOST_REQUIRE(host.submitTransaction("bad", 900.0, {}, "review", 0.8));

    frames(127);
    BOOST_CHECK_EQUAL(stateOf("bad"), TransitState::Spawning);
    BOOST_CHECK_EQUAL(host.getPendingClassificationCount(), 1u);

    frames(1);
    BOOST_CHECK_EQUAL(stateOf("bad"), TransitState::Flagged);
    BOOST_CHECK_EQUAL(host.getPendingClassificationCount(), 0u);
    BOOST_CHECK_EQUAL(host.getScheduler().snapshotStats().threatCount, 1u);
}

BOOST_AUTO_TEST_CASE(TestClearAppliedAfterLongerDelay) {
    BOOST_REQUIRE(host.submitTransaction("good", 40.0, {}, "approve", 0.05));

    frames(159);
    BOOST_CHECK_EQUAL(stateOf("good"), TransitState::Scanning);

    frames(1);
    BOOST_CHECK_EQUAL(stateOf("good"), TransitState::Clearing);

    auto entity = host.getScheduler().getEntity("good");
    BOOST_REQUIRE(entity.has_value());
    BOOST_CHECK_EQUAL(entity->metadata.at("risk_score").asNumber(), 0.05);
}

BOOST_AUTO_TEST_CASE(TestDelayRunsInSchedulerTime) {
    BOOST_REQUIRE(host.submitTransaction("stall", 40.0, {}, "block", 0.95));

    // A ten second wall-clock gap advances scheduler time by one clamped step only
    driverTime += 10.0;
    host.onFrame(driverTime);
    BOOST_CHECK_EQUAL(host.getPendingClassificationCount(), 1u);
    BOOST_CHECK_LT(host.getScheduler().getTime(), 1.0);
}

BOOST_AUTO_TEST_CASE(TestExplicitScheduleWithZeroDelay) {
    BOOST_REQUIRE(host.getScheduler().addEntity("manual", 10.0));
    host.scheduleClassification("manual", false, 0.3, -5.0);
    frames(1);
    BOOST_CHECK_EQUAL(stateOf("manual"), TransitState::Clearing);
}

BOOST_AUTO_TEST_CASE(TestResubmittedIdIgnoresStaleVerdict) {
    SchedulerConfig cfg;
    cfg.maxTransitEntities = 1;
    VisualizerHost small(cfg, 800.0f, 500.0f);
    double t = 0.0;
    small.onFrame(t);

    // Clear verdict queued for 2.5 s, but the entity is flagged directly and finishes first
    BOOST_REQUIRE(small.submitTransaction("again", 50.0, {}, "approve", 0.1));
    BOOST_REQUIRE(small.getScheduler().classify("again", true, 0.9));
    for (int i = 0; i < 256 && small.getScheduler().getEntity("again")->state != TransitState::Done; ++i) {
        t += STEP;
        small.onFrame(t);
    }
    BOOST_REQUIRE_EQUAL(small.getScheduler().getEntity("again")->state, TransitState::Done);
    BOOST_REQUIRE_LT(small.getScheduler().getTime(), 2.0);

    // Next insert evicts the finished entity, then the id returns
    BOOST_REQUIRE(small.submitTransaction("other", 50.0, {}, "approve", 0.1));
    BOOST_REQUIRE(!small.getScheduler().getEntity("again").has_value());
    BOOST_REQUIRE(small.submitTransaction("again", 50.0, {}, "approve", 0.2));
    const double resubmitted = small.getScheduler().getTime();
    BOOST_CHECK_EQUAL(small.getPendingClassificationCount(), 2u);

    // Past the old due time the new entity is still untouched
    while (small.getScheduler().getTime() < 2.6) {
        t += STEP;
        small.onFrame(t);
    }
    BOOST_CHECK_EQUAL(small.getScheduler().getEntity("again")->classification,
                      Classification::Neutral);

    // Its own verdict arrives on schedule
    while (small.getScheduler().getTime() < resubmitted + VisualizerHost::CLEAR_CLASSIFICATION_DELAY) {
        t += STEP;
        small.onFrame(t);
    }
    BOOST_CHECK_EQUAL(small.getScheduler().getEntity("again")->classification,
                      Classification::Clear);
    BOOST_CHECK_EQUAL(small.getScheduler().getEntity("again")->metadata.at("risk_score").asNumber(), 0.2);
}

BOOST_AUTO_TEST_CASE(TestDueForUnknownIdIsDropped) {
    host.scheduleClassification("ghost", true, 0.9, 0.0);
    frames(1);
    BOOST_CHECK_EQUAL(host.getPendingClassificationCount(), 0u);
    BOOST_CHECK_EQUAL(host.getScheduler().snapshotStats().threatCount, 0u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// FRAME, POINTER AND LIFECYCLE
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(HostLifecycleTests, HostFixture)

BOOST_AUTO_TEST_CASE(TestAdapterReceivesOneSnapshotPerFrame) {
    BOOST_CHECK_EQUAL(adapter.renderCount, 1);
    host.submitTransaction("r1", 10.0, {}, "approve", 0.1);
    frames(3);
    BOOST_CHECK_EQUAL(adapter.renderCount, 4);
    BOOST_REQUIRE_EQUAL(adapter.lastFrame.transits.size(), 1u);
    BOOST_CHECK_EQUAL(adapter.lastFrame.transits.front().id, "r1");
    BOOST_CHECK_CLOSE(adapter.lastFrame.time, 3.0 * STEP, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestClickNotifiesListeners) {
    BOOST_REQUIRE(host.submitTransaction("click-me", 100.0, {}, "approve", 0.1));
    frames(32);

    std::vector<std::string> received;
    const auto listenerId = host.addClickListener(
        [&received](const EntityClickEvent& event) { received.push_back(event.id); });

    auto entity = host.getScheduler().getEntity("click-me");
    BOOST_REQUIRE(entity.has_value());
    const Vector2D at = entity->position;

    BOOST_CHECK(host.onPointerClick(at.getX(), at.getY()));
    BOOST_REQUIRE_EQUAL(received.size(), 1u);
    BOOST_CHECK_EQUAL(received.front(), "click-me");

    BOOST_CHECK(!host.onPointerClick(-5000.0f, -5000.0f));
    BOOST_CHECK_EQUAL(received.size(), 1u);

    BOOST_CHECK(host.removeClickListener(listenerId));
    BOOST_CHECK(!host.removeClickListener(listenerId));
    BOOST_CHECK(host.onPointerClick(at.getX(), at.getY()));
    BOOST_CHECK_EQUAL(received.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestListenerMayRemoveItself) {
    BOOST_REQUIRE(host.submitTransaction("self", 100.0, {}, "approve", 0.1));
    frames(1);

    int calls = 0;
    VisualizerHost::ListenerId selfId = 0;
    selfId = host.addClickListener([&](const EntityClickEvent&) {
        ++calls;
        host.removeClickListener(selfId);
    });

    const Vector2D at = host.getScheduler().getEntity("self")->position;
    host.onPointerClick(at.getX(), at.getY());
    host.onPointerClick(at.getX(), at.getY());
    BOOST_CHECK_EQUAL(calls, 1);
    BOOST_CHECK_EQUAL(host.getClickListenerCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestResizeValidation) {
    BOOST_CHECK(host.onResize(1000.0f, 600.0f));
    BOOST_CHECK_CLOSE(host.getScheduler().getLayout().entryCenter.getX(), 220.0f, 0.001f);

    BOOST_CHECK(!host.onResize(0.0f, 600.0f));
    BOOST_CHECK(!host.onResize(std::numeric_limits<float>::quiet_NaN(), 600.0f));
    BOOST_CHECK_CLOSE(host.getScheduler().getLayout().entryCenter.getX(), 220.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestStopHaltsEverything) {
    host.addClickListener([](const EntityClickEvent&) {});
    BOOST_REQUIRE(host.submitTransaction("s1", 10.0, {}, "approve", 0.1));

    host.stop();
    BOOST_CHECK(!host.isRunning());
    BOOST_CHECK_EQUAL(host.getClickListenerCount(), 0u);
    BOOST_CHECK_EQUAL(host.getPendingClassificationCount(), 0u);

    const uint64_t ticks = host.getScheduler().getTickCount();
    const int renders = adapter.renderCount;
    frames(10);
    BOOST_CHECK_EQUAL(host.getScheduler().getTickCount(), ticks);
    BOOST_CHECK_EQUAL(adapter.renderCount, renders);

    BOOST_CHECK(!host.submitTransaction("s2", 10.0, {}, "approve", 0.1));
    host.triggerPulse();
    BOOST_CHECK(host.getScheduler().getStore().getPulses().empty());

    // Stopping twice is harmless
    host.stop();
    BOOST_CHECK(!host.isRunning());
}

BOOST_AUTO_TEST_CASE(TestPulseWhileRunning) {
    host.triggerPulse();
    BOOST_CHECK_EQUAL(host.getScheduler().getStore().getPulses().size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
