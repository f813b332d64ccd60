/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/GrowthEntity.hpp"
#include <cmath>

namespace FortressEngine {

uint8_t GrowthEntity::stageForAge(double age, double growthPeriod) {
  if (!(age > 0.0) || !(growthPeriod > 0.0)) {
    return 0;
  }
  const double stage = std::floor(age / growthPeriod * 4.0);
  if (stage >= MAX_GROWTH_STAGE) {
    return MAX_GROWTH_STAGE;
  }
  return static_cast<uint8_t>(stage);
}

} // namespace FortressEngine
