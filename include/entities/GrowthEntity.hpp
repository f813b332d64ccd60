/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GROWTH_ENTITY_HPP
#define GROWTH_ENTITY_HPP

#include "utils/Vector2D.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace FortressEngine {

// Packed 0xRRGGBBAA
using PackedColor = uint32_t;

// Cosmetic palette growth objects pick from at creation
inline constexpr std::array<PackedColor, 6> GROWTH_PALETTE = {
    0x00e5ffff, 0x1e88e5ff, 0x80f0ffff, 0x40c4ffff, 0x7ec4cfff, 0x4ade80ff};

inline constexpr uint8_t MAX_GROWTH_STAGE = 3;

/**
 * @brief Object planted in the destination zone when a cleared transit
 * entity finishes landing.
 */
struct GrowthEntity {
  Vector2D anchor;
  size_t slot{0};
  uint8_t stage{0};
  double creationTime{0.0};
  std::string category;
  std::string sourceId;
  PackedColor color{GROWTH_PALETTE[0]};

  /**
   * @brief stage = clamp(floor(age / period * 4), 0, 3)
   * Negative ages (clock regression) map to stage 0.
   */
  static uint8_t stageForAge(double age, double growthPeriod);
};

} // namespace FortressEngine

#endif // GROWTH_ENTITY_HPP
