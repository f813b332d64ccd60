/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/TransitEntity.hpp"

namespace FortressEngine {

const char *toString(TransitState state) {
  switch (state) {
  case TransitState::Spawning:
    return "spawning";
  case TransitState::Scanning:
    return "scanning";
  case TransitState::Flagged:
    return "flagged";
  case TransitState::Clearing:
    return "clearing";
  case TransitState::Landing:
    return "landing";
  case TransitState::Done:
    return "done";
  }
  return "unknown";
}

const char *toString(Classification classification) {
  switch (classification) {
  case Classification::Neutral:
    return "neutral";
  case Classification::Flagged:
    return "flagged";
  case Classification::Clear:
    return "clear";
  }
  return "unknown";
}

} // namespace FortressEngine
