/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/LifecycleScheduler.hpp"
#include <algorithm>
#include "core/Logger.hpp"
#include "utils/CurveMath.hpp"
#include <cmath>

namespace FortressEngine {

namespace {

SchedulerConfig validatedConfig(const SchedulerConfig& config) {
    if (config.isValid()) {
        return config;
    }
    SCHEDULER_ERROR("Invalid scheduler configuration, using defaults");
    return SchedulerConfig{};
}

} // namespace

LifecycleScheduler::LifecycleScheduler(const SchedulerConfig& config,
                                       float canvasWidth, float canvasHeight)
    : m_config(validatedConfig(config)),
      m_clock(m_config.maxFrameStep),
      m_layout(LayoutCalculator::compute(800.0f, 500.0f)),
      m_store(m_config.maxTransitEntities, m_config.maxGrowthEntities),
      m_rng(m_config.randomSeed)
{
    if (!recomputeLayout(canvasWidth, canvasHeight)) {
        SCHEDULER_WARN("Initial canvas size rejected, using 800x500");
    }
    SCHEDULER_INFO("Lifecycle scheduler ready (transit ceiling " +
                   std::to_string(m_config.maxTransitEntities) + ", growth ceiling " +
                   std::to_string(m_config.maxGrowthEntities) + ")");
}

// ============================================================================
// FRAME UPDATE
// ============================================================================

void LifecycleScheduler::tick(double nowSeconds) {
    const double dt = m_clock.advance(nowSeconds);
    const double now = m_clock.getSimulationTime();

    m_scanAngle += dt * m_config.scanSweepSpeed;

    for (auto& entity : m_store.getTransits()) {
        updateTransit(entity, now, dt);
    }
    m_store.enforceLimits();

    updateGrowthStages(now);
    m_store.pruneExpiredEffects(now);
}

void LifecycleScheduler::updateTransit(TransitEntity& entity, double now, double dt) {
    // Done records are frozen, previous position included
    if (entity.isTerminal()) {
        return;
    }

    entity.previousPosition = entity.position;
    const double elapsed = now - entity.stateEntryTime;

    switch (entity.state) {
    case TransitState::Spawning:
        updateSpawning(entity, now, elapsed);
        break;
    case TransitState::Scanning:
        updateScanning(entity, now, elapsed);
        break;
    case TransitState::Flagged:
        updateFlagged(entity, now, elapsed, dt);
        break;
    case TransitState::Clearing:
        updateClearing(entity, now, elapsed);
        break;
    case TransitState::Landing:
        updateLanding(entity, now, elapsed);
        break;
    case TransitState::Done:
        break;
    }
}

void LifecycleScheduler::updateSpawning(TransitEntity& entity, double now, double elapsed) {
    entity.progress = static_cast<float>(
        CurveMath::clamp(elapsed / m_config.spawnDuration, 0.0, 1.0));
    entity.position = CurveMath::quadBezier(entity.startPoint, entity.controlPoints.front(),
                                            entity.target, entity.progress);

    if (entity.progress >= 1.0f) {
        enterState(entity, TransitState::Scanning, now);
    }
}

void LifecycleScheduler::updateScanning(TransitEntity& entity, double now, double elapsed) {
    entity.progress = CurveMath::triangleWave(elapsed, m_config.scanRampDuration);

    const double angle = now * m_config.orbitAngularSpeed + entity.orbitPhase;
    const float radius = m_layout.entryRadius * m_config.orbitRadiusFactor;
    const float breathe = 0.3f + 0.7f * entity.progress;

    entity.position = Vector2D(
        m_layout.entryCenter.getX() + static_cast<float>(std::cos(angle)) * radius * breathe,
        m_layout.entryCenter.getY() + static_cast<float>(std::sin(angle)) * radius * 0.6f * breathe);
}

void LifecycleScheduler::updateFlagged(TransitEntity& entity, double now, double elapsed,
                                       double dt) {
    const double total = m_config.flagShakeDuration + m_config.flagExitDuration;
    entity.progress = static_cast<float>(CurveMath::clamp(elapsed / total, 0.0, 1.0));

    // Shake sub-phase is stationary; the renderer adds the jitter
    if (elapsed < m_config.flagShakeDuration) {
        return;
    }

    const float exitT = static_cast<float>(CurveMath::clamp(
        (elapsed - m_config.flagShakeDuration) / m_config.flagExitDuration, 0.0, 1.0));
    const float speed = m_config.flagExitBaseSpeed + exitT * m_config.flagExitSpeedGain;
    entity.position.setY(entity.position.getY() - static_cast<float>(dt) * speed);

    if (entity.position.getY() < -entity.size * 2.0f) {
        enterState(entity, TransitState::Done, now);
    }
}

void LifecycleScheduler::updateClearing(TransitEntity& entity, double now, double elapsed) {
    entity.progress = static_cast<float>(
        CurveMath::clamp(elapsed / m_config.clearDuration, 0.0, 1.0));
    entity.position = CurveMath::quadBezier(entity.startPoint, entity.controlPoints.front(),
                                            entity.target, entity.progress);

    if (entity.progress >= 1.0f) {
        enterState(entity, TransitState::Landing, now);
    }
}

void LifecycleScheduler::updateLanding(TransitEntity& entity, double now, double elapsed) {
    entity.progress = static_cast<float>(
        CurveMath::clamp(elapsed / m_config.landDuration, 0.0, 1.0));

    if (entity.progress >= 1.0f) {
        plantGrowth(entity, now);
        enterState(entity, TransitState::Done, now);
    }
}

void LifecycleScheduler::enterState(TransitEntity& entity, TransitState state, double now) {
    SCHEDULER_DEBUG(entity.id + ": " + toString(entity.state) + " -> " + toString(state));
    entity.state = state;
    entity.stateEntryTime = now;
    if (state == TransitState::Done) {
        entity.progress = 1.0f;
    } else {
        entity.progress = 0.0f;
    }
}

void LifecycleScheduler::plantGrowth(const TransitEntity& entity, double now) {
    const size_t columns = m_config.growthColumns;
    const size_t slot = m_store.claimGrowthSlot(columns * LayoutCalculator::GROWTH_ROWS);

    GrowthEntity growth;
    growth.slot = slot;
    growth.anchor = LayoutCalculator::growthSlotAnchor(m_layout, slot, columns);
    growth.stage = 0;
    growth.creationTime = now;
    growth.sourceId = entity.id;

    auto category = entity.metadata.find(m_config.categoryKey);
    if (category != entity.metadata.end() && category->second.isString()) {
        growth.category = category->second.asString();
    }

    std::uniform_int_distribution<size_t> pick(0, GROWTH_PALETTE.size() - 1);
    growth.color = GROWTH_PALETTE[pick(m_rng)];

    m_store.addGrowth(std::move(growth));

    TransientEffect burst;
    burst.position = entity.position;
    burst.startTime = now;
    burst.lifetime = m_config.burstLifetime;
    burst.maxRadius = m_config.burstRadius;
    m_store.addBurst(burst);
}

void LifecycleScheduler::updateGrowthStages(double now) {
    for (auto& growth : m_store.getGrowths()) {
        const uint8_t stage = GrowthEntity::stageForAge(now - growth.creationTime,
                                                        m_config.growthPeriod);
        growth.stage = std::max(growth.stage, stage);
    }
}

// ============================================================================
// EXTERNAL MUTATIONS
// ============================================================================

bool LifecycleScheduler::addEntity(const std::string& id, double magnitude,
                                   JsonObject metadata) {
    if (m_store.containsTransit(id)) {
        SCHEDULER_DEBUG("addEntity ignored for live id " + id);
        return false;
    }

    const double now = m_clock.getSimulationTime();

    TransitEntity entity;
    entity.id = id;
    entity.magnitude = magnitude;
    entity.size = CurveMath::sizeFromMagnitude(magnitude);
    entity.orbitPhase = CurveMath::orbitPhaseFor(id);
    entity.metadata = std::move(metadata);
    entity.state = TransitState::Spawning;
    entity.stateEntryTime = now;

    const float entryX = m_layout.entryCenter.getX();
    const float entryY = m_layout.entryCenter.getY();
    const float entryR = m_layout.entryRadius;

    const float startY = entryY + (randomUnit() - 0.5f) * entryR * 1.6f;
    entity.startPoint = Vector2D(-entity.size, startY);
    entity.controlPoints.push_back(
        Vector2D(entryX * 0.45f, startY + (randomUnit() - 0.5f) * entryR * 0.8f));
    entity.target = m_layout.entryCenter;
    entity.position = entity.startPoint;
    entity.previousPosition = entity.startPoint;

    return m_store.insertTransit(std::move(entity));
}

bool LifecycleScheduler::classify(const std::string& id, bool isThreat, double score) {
    TransitEntity* entity = m_store.findTransit(id);
    if (!entity) {
        SCHEDULER_DEBUG("classify ignored for unknown id " + id);
        return false;
    }
    if (!entity->isAwaitingClassification()) {
        SCHEDULER_DEBUG("classify ignored for " + id + " in state " + toString(entity->state));
        return false;
    }
    if (entity->state == TransitState::Spawning && !m_config.allowEarlyClassification) {
        SCHEDULER_DEBUG("classify ignored for " + id + " while spawning");
        return false;
    }

    const double now = m_clock.getSimulationTime();
    entity->metadata["risk_score"] = JsonValue(score);

    if (isThreat) {
        entity->classification = Classification::Flagged;
        enterState(*entity, TransitState::Flagged, now);
    } else {
        entity->classification = Classification::Clear;
        enterState(*entity, TransitState::Clearing, now);

        const Vector2D start = entity->position;
        const Vector2D target =
            m_layout.destinationCenter + Vector2D(0.0f, m_layout.destinationRadius * 0.5f);
        const float lift = m_layout.entryRadius * 0.5f * (0.5f + randomUnit());

        entity->startPoint = start;
        entity->target = target;
        entity->controlPoints.clear();
        entity->controlPoints.push_back(
            Vector2D((start.getX() + target.getX()) * 0.5f, start.getY() - lift));
    }

    m_store.recordClassification(entity->classification);
    return true;
}

bool LifecycleScheduler::recomputeLayout(float width, float height) {
    if (!std::isfinite(width) || !std::isfinite(height) || width <= 0.0f || height <= 0.0f) {
        LAYOUT_WARN("Rejected canvas size " + std::to_string(width) + "x" +
                    std::to_string(height));
        return false;
    }
    m_layout = LayoutCalculator::compute(width, height);
    LAYOUT_DEBUG("Layout recomputed for " + std::to_string(width) + "x" +
                 std::to_string(height));
    return true;
}

void LifecycleScheduler::triggerPulse() {
    TransientEffect pulse;
    pulse.position = m_layout.entryCenter;
    pulse.startTime = m_clock.getSimulationTime();
    pulse.lifetime = m_config.pulseLifetime;
    pulse.maxRadius = m_layout.entryRadius * 1.8f;
    m_store.addPulse(pulse);
}

// ============================================================================
// QUERIES
// ============================================================================

std::optional<HitResult> LifecycleScheduler::hitTest(float x, float y) const {
    return m_store.hitTest(Vector2D(x, y), m_config.hitPadding);
}

std::optional<TransitEntity> LifecycleScheduler::getEntity(const std::string& id) const {
    const TransitEntity* entity = m_store.findTransit(id);
    if (!entity) {
        return std::nullopt;
    }
    return *entity;
}

FrameSnapshot LifecycleScheduler::snapshot() const {
    FrameSnapshot frame;
    frame.time = m_clock.getSimulationTime();
    frame.scanAngle = m_scanAngle;
    frame.flagShakeDuration = m_config.flagShakeDuration;
    frame.layout = m_layout;
    frame.transits = m_store.getTransits();
    frame.growths.assign(m_store.getGrowths().begin(), m_store.getGrowths().end());
    frame.pulses = m_store.getPulses();
    frame.bursts = m_store.getBursts();
    frame.stats = m_store.snapshotStats();
    return frame;
}

float LifecycleScheduler::randomUnit() {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    return unit(m_rng);
}

} // namespace FortressEngine
