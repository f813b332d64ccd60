/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TRANSIT_ENTITY_HPP
#define TRANSIT_ENTITY_HPP

#include "utils/JsonReader.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <ostream>
#include <string>

namespace FortressEngine {

enum class TransitState : uint8_t {
  Spawning = 0,
  Scanning = 1,
  Flagged = 2,
  Clearing = 3,
  Landing = 4,
  Done = 5
};

enum class Classification : uint8_t { Neutral = 0, Flagged = 1, Clear = 2 };

const char *toString(TransitState state);
const char *toString(Classification classification);

// Stream operators for Boost.Test
inline std::ostream &operator<<(std::ostream &os, TransitState state) {
  return os << toString(state);
}

inline std::ostream &operator<<(std::ostream &os, Classification classification) {
  return os << toString(classification);
}

/**
 * @brief One transaction token moving through the pipeline.
 *
 * Owned by the EntityStore; everything handed outside the store is a copy.
 * Once state reaches Done the record is frozen.
 */
struct TransitEntity {
  using ControlPoints = boost::container::small_vector<Vector2D, 2>;

  std::string id;
  double magnitude{0.0};
  float size{6.0f};

  Vector2D position;
  Vector2D previousPosition;
  Vector2D startPoint;  // Origin of the active Bezier segment
  Vector2D target;      // End of the active Bezier segment
  ControlPoints controlPoints;

  Classification classification{Classification::Neutral};
  TransitState state{TransitState::Spawning};
  double stateEntryTime{0.0};
  float progress{0.0f};

  // Derived once from the id at creation; never recomputed
  float orbitPhase{0.0f};

  JsonObject metadata;

  bool isTerminal() const { return state == TransitState::Done; }

  // Only Spawning/Scanning entities are still waiting for a verdict
  bool isAwaitingClassification() const {
    return state == TransitState::Spawning || state == TransitState::Scanning;
  }

  Vector2D velocity() const { return position - previousPosition; }
};

} // namespace FortressEngine

#endif // TRANSIT_ENTITY_HPP
