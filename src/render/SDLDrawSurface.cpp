/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "render/SDLDrawSurface.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <array>
#include <cmath>
#include <numbers>
#include <string>

namespace FortressEngine {

SDLDrawSurface::SDLDrawSurface(SDL_Renderer* renderer) : mp_renderer(renderer) {
    if (!mp_renderer) {
        RENDER_ERROR("SDLDrawSurface created without a renderer");
        return;
    }
    SDL_SetRenderDrawBlendMode(mp_renderer, SDL_BLENDMODE_BLEND);
}

void SDLDrawSurface::setColor(const Color& color) {
    SDL_SetRenderDrawColor(mp_renderer, color.r, color.g, color.b, color.a);
}

void SDLDrawSurface::clear(const Color& color) {
    setColor(color);
    if (!SDL_RenderClear(mp_renderer)) {
        RENDER_ERROR(std::string("SDL_RenderClear failed: ") + SDL_GetError());
    }
}

void SDLDrawSurface::fillCircle(const Vector2D& center, float radius, const Color& color) {
    if (radius <= 0.0f) {
        return;
    }
    setColor(color);

    // One horizontal span per pixel row
    const float cx = center.getX();
    const float cy = center.getY();
    for (float dy = -radius; dy <= radius; dy += 1.0f) {
        const float halfWidth = std::sqrt(radius * radius - dy * dy);
        SDL_RenderLine(mp_renderer, cx - halfWidth, cy + dy, cx + halfWidth, cy + dy);
    }
}

void SDLDrawSurface::strokeCircle(const Vector2D& center, float radius, const Color& color) {
    if (radius <= 0.0f) {
        return;
    }
    setColor(color);

    std::array<SDL_FPoint, CIRCLE_SEGMENTS + 1> points{};
    const float step = 2.0f * std::numbers::pi_v<float> / static_cast<float>(CIRCLE_SEGMENTS);
    for (int i = 0; i <= CIRCLE_SEGMENTS; ++i) {
        const float angle = step * static_cast<float>(i);
        points[i] = SDL_FPoint{center.getX() + std::cos(angle) * radius,
                               center.getY() + std::sin(angle) * radius};
    }
    SDL_RenderLines(mp_renderer, points.data(), static_cast<int>(points.size()));
}

void SDLDrawSurface::drawLine(const Vector2D& from, const Vector2D& to, const Color& color) {
    setColor(color);
    SDL_RenderLine(mp_renderer, from.getX(), from.getY(), to.getX(), to.getY());
}

void SDLDrawSurface::strokeRect(const ZoneRect& rect, const Color& color) {
    setColor(color);
    const SDL_FRect sdlRect{rect.x, rect.y, rect.width, rect.height};
    SDL_RenderRect(mp_renderer, &sdlRect);
}

void SDLDrawSurface::present() {
    SDL_RenderPresent(mp_renderer);
}

} // namespace FortressEngine
