/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "render/SnapshotRenderer.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <numbers>
#include <string>

namespace FortressEngine {

namespace {
constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;

Vector2D onCircle(const Vector2D& center, float radius, float angle) {
    return Vector2D(center.getX() + std::cos(angle) * radius,
                    center.getY() + std::sin(angle) * radius);
}
} // namespace

SnapshotRenderer::SnapshotRenderer(IDrawSurface& surface, uint32_t jitterSeed)
    : m_surface(surface), m_jitterRng(jitterSeed)
{
}

Color SnapshotRenderer::colorFor(Classification classification) {
    switch (classification) {
    case Classification::Flagged:
        return Palette::THREAT_RED;
    case Classification::Clear:
        return Palette::CLEAR_GREEN;
    case Classification::Neutral:
    default:
        return Palette::POD_BLUE;
    }
}

void SnapshotRenderer::render(const FrameSnapshot& frame) {
    m_surface.clear(Palette::DEEP_SPACE);

    drawZones(frame);
    drawGrowths(frame);
    drawTransits(frame);
    drawEffects(frame);

    m_surface.present();
    if (m_framesRendered == 0) {
        RENDER_DEBUG("First frame drawn with " + std::to_string(m_lastDrawnEntities) +
                     " transit entities");
    }
    ++m_framesRendered;
}

void SnapshotRenderer::drawZones(const FrameSnapshot& frame) {
    const LayoutGeometry& layout = frame.layout;

    m_surface.strokeCircle(layout.entryCenter, layout.entryRadius, Palette::POD_BLUE.faded(0.6f));
    m_surface.strokeCircle(layout.entryCenter, layout.entryRadius * 0.6f,
                           Palette::POD_BLUE.faded(0.3f));

    const float angle = static_cast<float>(std::fmod(frame.scanAngle, TWO_PI));
    m_surface.drawLine(layout.entryCenter, onCircle(layout.entryCenter, layout.entryRadius, angle),
                       Palette::AMBER.faded(0.5f));

    m_surface.strokeRect(layout.destinationBounds, Palette::CLEAR_GREEN.faded(0.35f));
}

void SnapshotRenderer::drawGrowths(const FrameSnapshot& frame) {
    for (const auto& growth : frame.growths) {
        const float radius = 4.0f + static_cast<float>(growth.stage) * 3.0f;
        m_surface.fillCircle(growth.anchor, radius, Color::fromPacked(growth.color));
    }
}

void SnapshotRenderer::drawTransits(const FrameSnapshot& frame) {
    size_t drawn = 0;

    for (const auto& entity : frame.transits) {
        if (entity.isTerminal()) {
            continue;
        }

        const Color color = colorFor(entity.classification);
        Vector2D position = entity.position;

        const double elapsed = frame.time - entity.stateEntryTime;
        if (entity.state == TransitState::Flagged && elapsed < frame.flagShakeDuration) {
            position += Vector2D(jitter(), jitter());
        }

        const Vector2D velocity = entity.velocity();
        if (velocity.length() > TRAIL_MIN_SPEED) {
            m_surface.drawLine(position, position - velocity * TRAIL_LENGTH, color.faded(0.4f));
        }

        m_surface.fillCircle(position, entity.size, color);

        if (entity.state == TransitState::Scanning) {
            drawDashedRing(position, entity.size + 4.0f, static_cast<float>(frame.scanAngle),
                           Palette::AMBER.faded(0.8f));
        } else if (entity.state == TransitState::Landing) {
            m_surface.strokeCircle(position, entity.size + entity.progress * 10.0f,
                                   Palette::CLEAR_GREEN.faded(1.0f - entity.progress));
        }

        ++drawn;
    }

    m_lastDrawnEntities = drawn;
}

void SnapshotRenderer::drawEffects(const FrameSnapshot& frame) {
    for (const auto& pulse : frame.pulses) {
        const float t = pulse.progressAt(frame.time);
        m_surface.strokeCircle(pulse.position, pulse.maxRadius * t, Palette::POD_BLUE.faded(1.0f - t));
    }

    for (const auto& burst : frame.bursts) {
        const float t = burst.progressAt(frame.time);
        const float radius = burst.maxRadius * t;
        const Color color = Palette::CLEAR_GREEN.faded(1.0f - t);

        m_surface.strokeCircle(burst.position, radius, color);
        for (size_t i = 0; i < BURST_SPARKLES; ++i) {
            const float angle = TWO_PI * static_cast<float>(i) / static_cast<float>(BURST_SPARKLES);
            m_surface.fillCircle(onCircle(burst.position, radius, angle), 1.5f, color);
        }
    }
}

void SnapshotRenderer::drawDashedRing(const Vector2D& center, float radius, float phase,
                                      const Color& color) {
    const float segment = TWO_PI / static_cast<float>(SCAN_RING_DASHES);
    for (size_t i = 0; i < SCAN_RING_DASHES; ++i) {
        const float a0 = phase + segment * static_cast<float>(i);
        m_surface.drawLine(onCircle(center, radius, a0),
                           onCircle(center, radius, a0 + segment * 0.5f), color);
    }
}

float SnapshotRenderer::jitter() {
    std::uniform_real_distribution<float> offset(-SHAKE_AMPLITUDE, SHAKE_AMPLITUDE);
    return offset(m_jitterRng);
}

} // namespace FortressEngine
