/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNAPSHOT_RENDERER_HPP
#define SNAPSHOT_RENDERER_HPP

/**
 * @file SnapshotRenderer.hpp
 * @brief Draws a FrameSnapshot onto an IDrawSurface
 *
 * Draw order, back to front:
 * - background, entry zone rings with the rotating scan line, destination outline
 * - growth objects (radius grows with stage)
 * - transit entities with trails, shake jitter, scanning and landing rings
 * - pulse rings, then bursts with their sparkles
 *
 * Terminal entities are skipped.
 */

#include "render/DrawSurface.hpp"
#include "render/RenderAdapter.hpp"
#include <cstddef>
#include <cstdint>
#include <random>

namespace FortressEngine {

class SnapshotRenderer : public IRenderAdapter {
public:
    // Trail is drawn only above this per-frame displacement
    static constexpr float TRAIL_MIN_SPEED = 0.5f;
    static constexpr float TRAIL_LENGTH = 4.0f;
    static constexpr float SHAKE_AMPLITUDE = 3.0f;
    static constexpr size_t SCAN_RING_DASHES = 12;
    static constexpr size_t BURST_SPARKLES = 4;

    explicit SnapshotRenderer(IDrawSurface& surface, uint32_t jitterSeed = 0x51ab);
    ~SnapshotRenderer() override = default;

    SnapshotRenderer(const SnapshotRenderer&) = delete;
    SnapshotRenderer& operator=(const SnapshotRenderer&) = delete;

    void render(const FrameSnapshot& frame) override;

    uint64_t getFramesRendered() const { return m_framesRendered; }
    size_t getLastDrawnEntityCount() const { return m_lastDrawnEntities; }

    static Color colorFor(Classification classification);

private:
    void drawZones(const FrameSnapshot& frame);
    void drawGrowths(const FrameSnapshot& frame);
    void drawTransits(const FrameSnapshot& frame);
    void drawEffects(const FrameSnapshot& frame);
    void drawDashedRing(const Vector2D& center, float radius, float phase, const Color& color);
    float jitter();

    IDrawSurface& m_surface;
    std::mt19937 m_jitterRng;
    uint64_t m_framesRendered{0};
    size_t m_lastDrawnEntities{0};
};

} // namespace FortressEngine

#endif // SNAPSHOT_RENDERER_HPP
