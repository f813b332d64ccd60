/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RENDER_ADAPTER_HPP
#define RENDER_ADAPTER_HPP

/**
 * @file RenderAdapter.hpp
 * @brief Interface for anything that consumes one frame snapshot per tick
 *
 * The host calls render() right after the scheduler's tick. Adapters only
 * read the snapshot; they never reach back into the scheduler or the store.
 */

#include "render/FrameSnapshot.hpp"

namespace FortressEngine {

class IRenderAdapter
{
public:
    virtual ~IRenderAdapter() = default;

    /**
     * @brief Draw one frame
     * @param frame read-only copy of entity state, effects and zone geometry
     */
    virtual void render(const FrameSnapshot& frame) = 0;
};

} // namespace FortressEngine

#endif // RENDER_ADAPTER_HPP
