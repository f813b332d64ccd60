/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_STORE_HPP
#define ENTITY_STORE_HPP

/**
 * @file EntityStore.hpp
 * @brief Owner of every live entity record and of the aggregate counters.
 *
 * Collections:
 * - transit entities, keyed by id and iterated in insertion order
 * - growth entities, FIFO
 * - pulse and burst effects, pruned once expired
 *
 * Population limits:
 * - transit: when over the ceiling, Done entities are evicted oldest first
 *   until at or below it; non-terminal entities are never evicted, so the
 *   ceiling can be exceeded while everything is still in flight
 * - growth: strict FIFO once over the ceiling
 *
 * Single-threaded by contract: the scheduler's tick, addEntity and classify
 * all run on the same logical thread, so no locking is done here.
 */

#include "entities/GrowthEntity.hpp"
#include "entities/TransientEffect.hpp"
#include "entities/TransitEntity.hpp"
#include <cstdint>
#include <deque>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace FortressEngine {

struct PipelineStats {
  uint64_t totalCreated{0};
  uint64_t activeCount{0};
  uint64_t threatCount{0};
  uint64_t clearedCount{0};
  uint64_t growthCount{0};

  bool operator==(const PipelineStats &other) const = default;
};

inline std::ostream &operator<<(std::ostream &os, const PipelineStats &stats) {
  return os << "{created=" << stats.totalCreated
            << ", active=" << stats.activeCount
            << ", threats=" << stats.threatCount
            << ", cleared=" << stats.clearedCount
            << ", growth=" << stats.growthCount << "}";
}

// Result of a pointer hit test; the entity is a detached copy
struct HitResult {
  std::string id;
  TransitEntity entity;
};

class EntityStore {
public:
  EntityStore(size_t maxTransitEntities, size_t maxGrowthEntities);

  // --- Transit entities ---

  /**
   * @brief Inserts a new transit entity unless its id is already live
   * @return false (and changes nothing) for a duplicate id
   *
   * Bumps totalCreated, then enforces the transit ceiling.
   */
  bool insertTransit(TransitEntity entity);

  bool containsTransit(const std::string &id) const;
  TransitEntity *findTransit(const std::string &id);
  const TransitEntity *findTransit(const std::string &id) const;

  // Insertion-ordered view; the scheduler mutates entries in place
  std::vector<TransitEntity> &getTransits() { return m_transits; }
  const std::vector<TransitEntity> &getTransits() const { return m_transits; }
  size_t getTransitCount() const { return m_transits.size(); }
  size_t getActiveTransitCount() const;

  // Re-applies both ceilings; the scheduler calls this after every tick so
  // entities that finished during the tick are reclaimed
  void enforceLimits();

  void recordClassification(Classification classification);

  // --- Growth entities ---

  void addGrowth(GrowthEntity growth);
  std::deque<GrowthEntity> &getGrowths() { return m_growths; }
  const std::deque<GrowthEntity> &getGrowths() const { return m_growths; }

  // Next grid slot; cycles through [0, slotCount)
  size_t claimGrowthSlot(size_t slotCount);

  // --- Transient effects ---

  void addPulse(TransientEffect pulse);
  void addBurst(TransientEffect burst);
  const std::vector<TransientEffect> &getPulses() const { return m_pulses; }
  const std::vector<TransientEffect> &getBursts() const { return m_bursts; }
  void pruneExpiredEffects(double now);

  // --- Queries ---

  /**
   * @brief First live, non-terminal entity (insertion order) whose disc of
   * radius size + padding strictly contains the point
   */
  std::optional<HitResult> hitTest(const Vector2D &point, float padding) const;

  // Value copy; activeCount and growthCount are derived fresh
  PipelineStats snapshotStats() const;

  size_t getMaxTransitEntities() const { return m_maxTransitEntities; }
  size_t getMaxGrowthEntities() const { return m_maxGrowthEntities; }

  void clear();

private:
  void enforceTransitLimit();
  void enforceGrowthLimit();
  void rebuildIndex();

  size_t m_maxTransitEntities;
  size_t m_maxGrowthEntities;

  std::vector<TransitEntity> m_transits;
  std::unordered_map<std::string, size_t> m_transitIndex;

  std::deque<GrowthEntity> m_growths;
  size_t m_nextGrowthSlot{0};

  std::vector<TransientEffect> m_pulses;
  std::vector<TransientEffect> m_bursts;

  // Monotonic counters
  uint64_t m_totalCreated{0};
  uint64_t m_threatCount{0};
  uint64_t m_clearedCount{0};
};

} // namespace FortressEngine

#endif // ENTITY_STORE_HPP
