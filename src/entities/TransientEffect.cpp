/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/TransientEffect.hpp"
#include "utils/CurveMath.hpp"

namespace FortressEngine {

float TransientEffect::progressAt(double now) const {
  if (lifetime <= 0.0) {
    return 1.0f;
  }
  return static_cast<float>(CurveMath::clamp((now - startTime) / lifetime, 0.0, 1.0));
}

} // namespace FortressEngine
