/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DRAW_SURFACE_HPP
#define DRAW_SURFACE_HPP

/**
 * @file DrawSurface.hpp
 * @brief Minimal immediate-mode drawing interface the snapshot renderer targets
 *
 * The SDL3 demo implements it on top of SDL_Renderer; tests use a recording
 * mock. Coordinates are canvas pixels, origin top-left.
 */

#include "entities/GrowthEntity.hpp"
#include "utils/CurveMath.hpp"
#include "utils/Vector2D.hpp"
#include "world/LayoutCalculator.hpp"
#include <cstdint>

namespace FortressEngine {

struct Color {
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};
    uint8_t a{255};

    static constexpr Color fromPacked(PackedColor rgba) {
        return Color{static_cast<uint8_t>((rgba >> 24) & 0xff),
                     static_cast<uint8_t>((rgba >> 16) & 0xff),
                     static_cast<uint8_t>((rgba >> 8) & 0xff),
                     static_cast<uint8_t>(rgba & 0xff)};
    }

    // Alpha scaled by factor in [0,1]
    Color faded(float factor) const {
        const float f = CurveMath::clamp(factor, 0.0f, 1.0f);
        return Color{r, g, b, static_cast<uint8_t>(static_cast<float>(a) * f)};
    }

    bool operator==(const Color& other) const = default;
};

namespace Palette {
inline constexpr Color DEEP_SPACE = Color::fromPacked(0x0a0b14ff);
inline constexpr Color POD_BLUE = Color::fromPacked(0x7ec4cfff);
inline constexpr Color THREAT_RED = Color::fromPacked(0xef4444ff);
inline constexpr Color CLEAR_GREEN = Color::fromPacked(0x4ade80ff);
inline constexpr Color AMBER = Color::fromPacked(0xffb94fff);
} // namespace Palette

class IDrawSurface {
public:
    virtual ~IDrawSurface() = default;

    virtual void clear(const Color& color) = 0;
    virtual void fillCircle(const Vector2D& center, float radius, const Color& color) = 0;
    virtual void strokeCircle(const Vector2D& center, float radius, const Color& color) = 0;
    virtual void drawLine(const Vector2D& from, const Vector2D& to, const Color& color) = 0;
    virtual void strokeRect(const ZoneRect& rect, const Color& color) = 0;

    // Called once after every primitive of a frame has been issued
    virtual void present() {}
};

} // namespace FortressEngine

#endif // DRAW_SURFACE_HPP
