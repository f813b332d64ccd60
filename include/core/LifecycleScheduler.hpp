/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LIFECYCLE_SCHEDULER_HPP
#define LIFECYCLE_SCHEDULER_HPP

/**
 * @file LifecycleScheduler.hpp
 * @brief Per-frame driver of every transit entity's state machine.
 *
 *   spawning --(progress>=1)--> scanning --classify(threat)--> flagged --(off top)--> done
 *       |                          |
 *       +----classify (early)------+--classify(clear)--> clearing --> landing --> done
 *                                                                       (+growth, +burst)
 *
 * Progress is always derived from absolute elapsed time in the current state
 * (now - stateEntryTime), never accumulated per frame, so uneven frame pacing
 * cannot drift or double-advance a state. Each entity makes at most one
 * transition per tick, and the frame step itself is clamped by FrameClock.
 *
 * The scheduler is an explicitly owned aggregate (no singleton): the host
 * constructs it, drives tick() from its frame loop and forwards resize and
 * pointer notifications.
 */

#include "core/FrameClock.hpp"
#include "core/SchedulerConfig.hpp"
#include "entities/EntityStore.hpp"
#include "render/FrameSnapshot.hpp"
#include "world/LayoutCalculator.hpp"
#include <optional>
#include <random>
#include <string>

namespace FortressEngine {

class LifecycleScheduler {
public:
    /**
     * @param config tunables; an invalid config falls back to defaults
     * @param canvasWidth initial canvas width in pixels
     * @param canvasHeight initial canvas height in pixels
     */
    explicit LifecycleScheduler(const SchedulerConfig& config = SchedulerConfig{},
                                float canvasWidth = 800.0f,
                                float canvasHeight = 500.0f);

    /**
     * @brief Advance every live entity to the given driver timestamp
     * @param nowSeconds non-decreasing driver time in seconds
     */
    void tick(double nowSeconds);

    /**
     * @brief Spawn a transit entity at the left edge of the canvas
     * @return false when the id is already live (silent no-op)
     */
    bool addEntity(const std::string& id, double magnitude, JsonObject metadata = {});

    /**
     * @brief Apply a verdict to an entity awaiting one
     * @return false when the id is unknown, terminal, already classified, or
     * still spawning while early classification is disabled
     */
    bool classify(const std::string& id, bool isThreat, double score);

    /**
     * @brief Recompute zone geometry. In-flight Bezier segments keep their
     * previously computed points until their next transition.
     * @return false (layout unchanged) for non-positive or non-finite sizes
     */
    bool recomputeLayout(float width, float height);

    // Expanding ring over the entry zone
    void triggerPulse();

    std::optional<HitResult> hitTest(float x, float y) const;
    PipelineStats snapshotStats() const { return m_store.snapshotStats(); }
    FrameSnapshot snapshot() const;

    std::optional<TransitEntity> getEntity(const std::string& id) const;
    const LayoutGeometry& getLayout() const { return m_layout; }
    const EntityStore& getStore() const { return m_store; }
    const SchedulerConfig& getConfig() const { return m_config; }
    double getTime() const { return m_clock.getSimulationTime(); }
    double getScanAngle() const { return m_scanAngle; }
    uint64_t getTickCount() const { return m_clock.getFrameCount(); }

private:
    void updateTransit(TransitEntity& entity, double now, double dt);
    void updateSpawning(TransitEntity& entity, double now, double elapsed);
    void updateScanning(TransitEntity& entity, double now, double elapsed);
    void updateFlagged(TransitEntity& entity, double now, double elapsed, double dt);
    void updateClearing(TransitEntity& entity, double now, double elapsed);
    void updateLanding(TransitEntity& entity, double now, double elapsed);

    void enterState(TransitEntity& entity, TransitState state, double now);
    void plantGrowth(const TransitEntity& entity, double now);
    void updateGrowthStages(double now);
    float randomUnit();

    SchedulerConfig m_config;
    FrameClock m_clock;
    LayoutGeometry m_layout;
    EntityStore m_store;
    std::mt19937 m_rng;
    double m_scanAngle{0.0};
};

} // namespace FortressEngine

#endif // LIFECYCLE_SCHEDULER_HPP
