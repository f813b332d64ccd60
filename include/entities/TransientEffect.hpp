/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TRANSIENT_EFFECT_HPP
#define TRANSIENT_EFFECT_HPP

#include "utils/Vector2D.hpp"
#include <cstdint>

namespace FortressEngine {

enum class EffectKind : uint8_t {
  Pulse = 0, // Expanding ring over the entry zone (model refresh)
  Burst = 1  // Landing burst where a growth object was planted
};

// Short-lived decorative marker; dropped once its lifetime has elapsed
struct TransientEffect {
  EffectKind kind{EffectKind::Burst};
  Vector2D position;
  double startTime{0.0};
  double lifetime{1.5};
  float maxRadius{30.0f};

  float progressAt(double now) const;
  bool isExpired(double now) const { return now - startTime >= lifetime; }
};

} // namespace FortressEngine

#endif // TRANSIENT_EFFECT_HPP
