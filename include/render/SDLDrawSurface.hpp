/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SDL_DRAW_SURFACE_HPP
#define SDL_DRAW_SURFACE_HPP

#include "render/DrawSurface.hpp"

struct SDL_Renderer;

namespace FortressEngine {

/**
 * @brief IDrawSurface on top of an SDL3 renderer. The renderer is borrowed;
 * whoever created it destroys it.
 *
 * Circles are approximated by line segments (stroke) and horizontal spans
 * (fill); SDL's 2D renderer has no circle primitive.
 */
class SDLDrawSurface : public IDrawSurface {
public:
    static constexpr int CIRCLE_SEGMENTS = 32;

    explicit SDLDrawSurface(SDL_Renderer* renderer);
    ~SDLDrawSurface() override = default;

    SDLDrawSurface(const SDLDrawSurface&) = delete;
    SDLDrawSurface& operator=(const SDLDrawSurface&) = delete;

    void clear(const Color& color) override;
    void fillCircle(const Vector2D& center, float radius, const Color& color) override;
    void strokeCircle(const Vector2D& center, float radius, const Color& color) override;
    void drawLine(const Vector2D& from, const Vector2D& to, const Color& color) override;
    void strokeRect(const ZoneRect& rect, const Color& color) override;
    void present() override;

private:
    void setColor(const Color& color);

    SDL_Renderer* mp_renderer;
};

} // namespace FortressEngine

#endif // SDL_DRAW_SURFACE_HPP
