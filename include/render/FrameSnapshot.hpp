/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FRAME_SNAPSHOT_HPP
#define FRAME_SNAPSHOT_HPP

#include "entities/EntityStore.hpp"
#include "entities/GrowthEntity.hpp"
#include "entities/TransientEffect.hpp"
#include "entities/TransitEntity.hpp"
#include "world/LayoutCalculator.hpp"
#include <vector>

namespace FortressEngine {

/**
 * @brief Immutable per-frame copy of everything a renderer may draw.
 *
 * Terminal transit entities are included until the store evicts them;
 * renderers are expected to skip them.
 */
struct FrameSnapshot {
    double time{0.0};
    double scanAngle{0.0};
    double flagShakeDuration{0.5};
    LayoutGeometry layout;
    std::vector<TransitEntity> transits;
    std::vector<GrowthEntity> growths;
    std::vector<TransientEffect> pulses;
    std::vector<TransientEffect> bursts;
    PipelineStats stats;
};

} // namespace FortressEngine

#endif // FRAME_SNAPSHOT_HPP
