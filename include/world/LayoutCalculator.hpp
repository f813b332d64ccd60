/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LAYOUT_CALCULATOR_HPP
#define LAYOUT_CALCULATOR_HPP

#include "utils/Vector2D.hpp"
#include <cstddef>

namespace FortressEngine {

struct ZoneRect {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};

    float right() const { return x + width; }
    float bottom() const { return y + height; }
    Vector2D center() const { return Vector2D(x + width * 0.5f, y + height * 0.5f); }
    bool contains(const Vector2D& p) const {
        return p.getX() >= x && p.getX() <= right() &&
               p.getY() >= y && p.getY() <= bottom();
    }
};

/**
 * @brief Geometry of the three pipeline zones for one canvas size.
 *
 * Entry (inspection) zone on the left, transit corridor in the middle,
 * destination zone on the right where growth objects are planted.
 */
struct LayoutGeometry {
    float canvasWidth{0.0f};
    float canvasHeight{0.0f};

    Vector2D entryCenter;
    float entryRadius{0.0f};
    ZoneRect entryBounds;

    ZoneRect transitBounds;

    Vector2D destinationCenter;
    float destinationWidth{0.0f};
    float destinationHeight{0.0f};
    float destinationRadius{0.0f};
    ZoneRect destinationBounds;
};

namespace LayoutCalculator {

// Zone proportions relative to the canvas
inline constexpr float ENTRY_X = 0.22f;
inline constexpr float ENTRY_Y = 0.45f;
inline constexpr float ENTRY_RADIUS = 0.18f;    // of min(w, h)
inline constexpr float DEST_X = 0.78f;
inline constexpr float DEST_Y = 0.55f;
inline constexpr float DEST_WIDTH = 0.30f;
inline constexpr float DEST_HEIGHT = 0.45f;
inline constexpr float DEST_RADIUS = 0.14f;     // of min(w, h)
inline constexpr size_t GROWTH_ROWS = 4;

/**
 * @brief Pure function of the canvas size
 * @param width canvas width in pixels
 * @param height canvas height in pixels
 */
LayoutGeometry compute(float width, float height);

/**
 * @brief Centre of a growth grid slot inside the destination bounds
 * @param slot slot index, wrapped into [0, columns * GROWTH_ROWS)
 * @param columns grid columns (treated as 1 when zero)
 */
Vector2D growthSlotAnchor(const LayoutGeometry& layout, size_t slot, size_t columns);

} // namespace LayoutCalculator

} // namespace FortressEngine

#endif // LAYOUT_CALCULATOR_HPP
