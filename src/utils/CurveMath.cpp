/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/CurveMath.hpp"
#include <cmath>

namespace FortressEngine {
namespace CurveMath {

namespace {
constexpr uint32_t FNV_OFFSET_BASIS = 2166136261u;
constexpr uint32_t FNV_PRIME = 16777619u;
constexpr float MIN_ENTITY_SIZE = 6.0f;
constexpr float MAX_ENTITY_SIZE = 32.0f;
} // namespace

Vector2D quadBezier(const Vector2D& p0, const Vector2D& p1, const Vector2D& p2,
                    float t) {
    t = clamp(t, 0.0f, 1.0f);
    const float u = 1.0f - t;
    const float w0 = u * u;
    const float w1 = 2.0f * u * t;
    const float w2 = t * t;
    return Vector2D(w0 * p0.getX() + w1 * p1.getX() + w2 * p2.getX(),
                    w0 * p0.getY() + w1 * p1.getY() + w2 * p2.getY());
}

float sizeFromMagnitude(double magnitude) {
    const double raw = std::log10(magnitude / 100.0 + 1.0) * 6.0 + 6.0;
    return clamp(static_cast<float>(raw), MIN_ENTITY_SIZE, MAX_ENTITY_SIZE);
}

uint32_t hashIdentifier(std::string_view id) {
    uint32_t hash = FNV_OFFSET_BASIS;
    for (char c : id) {
        hash ^= static_cast<uint8_t>(c);
        hash *= FNV_PRIME;
    }
    return hash;
}

float orbitPhaseFor(std::string_view id) {
    return static_cast<float>(hashIdentifier(id) % 100u) * 0.5f;
}

float triangleWave(double elapsed, double rampSeconds) {
    if (rampSeconds <= 0.0 || elapsed <= 0.0) {
        return 0.0f;
    }
    const double cycle = std::fmod(elapsed, 2.0 * rampSeconds);
    const double value = cycle <= rampSeconds ? cycle / rampSeconds
                                              : 2.0 - cycle / rampSeconds;
    return static_cast<float>(clamp(value, 0.0, 1.0));
}

} // namespace CurveMath
} // namespace FortressEngine
