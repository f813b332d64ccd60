/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityStore.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace FortressEngine {

EntityStore::EntityStore(size_t maxTransitEntities, size_t maxGrowthEntities)
    : m_maxTransitEntities(maxTransitEntities),
      m_maxGrowthEntities(maxGrowthEntities) {
  m_transits.reserve(maxTransitEntities + 1);
}

bool EntityStore::insertTransit(TransitEntity entity) {
  if (m_transitIndex.count(entity.id) > 0) {
    ENTITYSTORE_DEBUG("Duplicate transit id ignored: " + entity.id);
    return false;
  }

  m_transitIndex.emplace(entity.id, m_transits.size());
  m_transits.push_back(std::move(entity));
  ++m_totalCreated;

  enforceTransitLimit();
  return true;
}

bool EntityStore::containsTransit(const std::string &id) const {
  return m_transitIndex.count(id) > 0;
}

TransitEntity *EntityStore::findTransit(const std::string &id) {
  auto it = m_transitIndex.find(id);
  return it != m_transitIndex.end() ? &m_transits[it->second] : nullptr;
}

const TransitEntity *EntityStore::findTransit(const std::string &id) const {
  auto it = m_transitIndex.find(id);
  return it != m_transitIndex.end() ? &m_transits[it->second] : nullptr;
}

size_t EntityStore::getActiveTransitCount() const {
  return static_cast<size_t>(
      std::count_if(m_transits.begin(), m_transits.end(),
                    [](const TransitEntity &e) { return !e.isTerminal(); }));
}

void EntityStore::recordClassification(Classification classification) {
  switch (classification) {
  case Classification::Flagged:
    ++m_threatCount;
    break;
  case Classification::Clear:
    ++m_clearedCount;
    break;
  case Classification::Neutral:
    break;
  }
}

void EntityStore::addGrowth(GrowthEntity growth) {
  m_growths.push_back(std::move(growth));
  enforceGrowthLimit();
}

size_t EntityStore::claimGrowthSlot(size_t slotCount) {
  if (slotCount == 0) {
    return 0;
  }
  const size_t slot = m_nextGrowthSlot % slotCount;
  m_nextGrowthSlot = (slot + 1) % slotCount;
  return slot;
}

void EntityStore::addPulse(TransientEffect pulse) {
  pulse.kind = EffectKind::Pulse;
  m_pulses.push_back(pulse);
}

void EntityStore::addBurst(TransientEffect burst) {
  burst.kind = EffectKind::Burst;
  m_bursts.push_back(burst);
}

void EntityStore::pruneExpiredEffects(double now) {
  auto expired = [now](const TransientEffect &effect) {
    return effect.isExpired(now);
  };
  std::erase_if(m_pulses, expired);
  std::erase_if(m_bursts, expired);
}

std::optional<HitResult> EntityStore::hitTest(const Vector2D &point,
                                               float padding) const {
  for (const auto &entity : m_transits) {
    if (entity.isTerminal()) {
      continue;
    }
    const float radius = entity.size + padding;
    if (Vector2D::distanceSquared(point, entity.position) < radius * radius) {
      return HitResult{entity.id, entity};
    }
  }
  return std::nullopt;
}

PipelineStats EntityStore::snapshotStats() const {
  PipelineStats stats;
  stats.totalCreated = m_totalCreated;
  stats.activeCount = getActiveTransitCount();
  stats.threatCount = m_threatCount;
  stats.clearedCount = m_clearedCount;
  stats.growthCount = m_growths.size();
  return stats;
}

void EntityStore::clear() {
  m_transits.clear();
  m_transitIndex.clear();
  m_growths.clear();
  m_pulses.clear();
  m_bursts.clear();
  m_nextGrowthSlot = 0;
}

void EntityStore::enforceLimits() {
  enforceTransitLimit();
  enforceGrowthLimit();
}

void EntityStore::enforceTransitLimit() {
  if (m_transits.size() <= m_maxTransitEntities) {
    return;
  }

  size_t excess = m_transits.size() - m_maxTransitEntities;
  const size_t before = m_transits.size();

  // Oldest terminal entities go first; in-flight ones are never touched
  size_t write = 0;
  for (size_t read = 0; read < m_transits.size(); ++read) {
    if (excess > 0 && m_transits[read].isTerminal()) {
      --excess;
      continue;
    }
    if (write != read) {
      m_transits[write] = std::move(m_transits[read]);
    }
    ++write;
  }
  m_transits.resize(write);

  if (m_transits.size() != before) {
    rebuildIndex();
    ENTITYSTORE_DEBUG("Evicted " + std::to_string(before - m_transits.size()) +
                      " terminal transit entities");
  }
  if (m_transits.size() > m_maxTransitEntities) {
    ENTITYSTORE_DEBUG("Transit ceiling exceeded with only in-flight entities: " +
                      std::to_string(m_transits.size()));
  }
}

void EntityStore::enforceGrowthLimit() {
  while (m_growths.size() > m_maxGrowthEntities) {
    m_growths.pop_front();
  }
}

void EntityStore::rebuildIndex() {
  m_transitIndex.clear();
  for (size_t i = 0; i < m_transits.size(); ++i) {
    m_transitIndex.emplace(m_transits[i].id, i);
  }
}

} // namespace FortressEngine
