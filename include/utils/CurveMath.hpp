/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CURVE_MATH_HPP
#define CURVE_MATH_HPP

#include "utils/Vector2D.hpp"
#include <cstdint>
#include <string_view>

namespace FortressEngine {
namespace CurveMath {

// Unlike std::clamp, lo > hi is tolerated (yields lo)
inline double clamp(double value, double lo, double hi) {
    return value < lo ? lo : (value > hi ? hi : value);
}

inline float clamp(float value, float lo, float hi) {
    return value < lo ? lo : (value > hi ? hi : value);
}

/**
 * @brief Quadratic Bezier B(t) = (1-t)^2 p0 + 2(1-t)t p1 + t^2 p2
 * @param t Curve parameter, clamped to [0,1]
 */
Vector2D quadBezier(const Vector2D& p0, const Vector2D& p1, const Vector2D& p2,
                    float t);

/**
 * @brief Visual size of a transit entity from its transaction magnitude:
 * clamp(log10(magnitude/100 + 1) * 6 + 6, 6, 32)
 */
float sizeFromMagnitude(double magnitude);

// 32-bit FNV-1a over the raw identifier bytes
uint32_t hashIdentifier(std::string_view id);

/**
 * @brief Orbit phase offset for the scanning orbit, (hash mod 100) * 0.5.
 * Stable for a given identifier across runs and platforms.
 */
float orbitPhaseFor(std::string_view id);

// Triangle wave in [0,1]: ramps up over rampSeconds, back down over the next
float triangleWave(double elapsed, double rampSeconds);

} // namespace CurveMath
} // namespace FortressEngine

#endif // CURVE_MATH_HPP
