/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/LayoutCalculator.hpp"
#include <algorithm>

namespace FortressEngine {
namespace LayoutCalculator {

LayoutGeometry compute(float width, float height) {
    LayoutGeometry layout;
    layout.canvasWidth = width;
    layout.canvasHeight = height;

    const float minDim = std::min(width, height);

    // Entry / inspection zone
    layout.entryCenter = Vector2D(width * ENTRY_X, height * ENTRY_Y);
    layout.entryRadius = minDim * ENTRY_RADIUS;
    layout.entryBounds = ZoneRect{layout.entryCenter.getX() - layout.entryRadius,
                                  layout.entryCenter.getY() - layout.entryRadius,
                                  layout.entryRadius * 2.0f,
                                  layout.entryRadius * 2.0f};

    // Destination zone
    layout.destinationCenter = Vector2D(width * DEST_X, height * DEST_Y);
    layout.destinationWidth = width * DEST_WIDTH;
    layout.destinationHeight = height * DEST_HEIGHT;
    layout.destinationRadius = minDim * DEST_RADIUS;
    layout.destinationBounds =
        ZoneRect{layout.destinationCenter.getX() - layout.destinationWidth * 0.5f,
                 layout.destinationCenter.getY() - layout.destinationHeight * 0.5f,
                 layout.destinationWidth, layout.destinationHeight};

    // Transit corridor spans the gap between the two, at entry-zone height
    const float transitLeft = layout.entryBounds.right();
    const float transitRight = std::max(transitLeft, layout.destinationBounds.x);
    layout.transitBounds = ZoneRect{transitLeft, layout.entryBounds.y,
                                    transitRight - transitLeft,
                                    layout.entryBounds.height};

    return layout;
}

Vector2D growthSlotAnchor(const LayoutGeometry& layout, size_t slot, size_t columns) {
    columns = std::max<size_t>(columns, 1);
    slot %= columns * GROWTH_ROWS;

    const size_t column = slot % columns;
    const size_t row = slot / columns;
    const ZoneRect& box = layout.destinationBounds;
    const float cellWidth = box.width / static_cast<float>(columns);
    const float cellHeight = box.height / static_cast<float>(GROWTH_ROWS);

    return Vector2D(box.x + (static_cast<float>(column) + 0.5f) * cellWidth,
                    box.y + (static_cast<float>(row) + 0.5f) * cellHeight);
}

} // namespace LayoutCalculator
} // namespace FortressEngine
