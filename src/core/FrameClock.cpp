/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/FrameClock.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace FortressEngine {

FrameClock::FrameClock(double maxStep)
    : m_maxStep(maxStep > 0.0 ? maxStep : 0.1)
{
}

double FrameClock::advance(double timestampSeconds) {
    ++m_frameCount;

    if (!std::isfinite(timestampSeconds)) {
        // Treated as "no progress"; baseline is kept
        ++m_regressionCount;
        m_lastStep = 0.0;
        FRAMECLOCK_WARN("Non-finite frame timestamp ignored");
        return 0.0;
    }

    if (!m_hasBaseline) {
        m_hasBaseline = true;
        m_lastTimestamp = timestampSeconds;
        m_lastStep = 0.0;
        return 0.0;
    }

    double delta = timestampSeconds - m_lastTimestamp;
    m_lastTimestamp = timestampSeconds;

    if (delta < 0.0) {
        ++m_regressionCount;
        FRAMECLOCK_WARN("Frame timestamp went backwards by " + std::to_string(-delta) + "s, no progress this tick");
        delta = 0.0;
    }

    // Clamp delta to prevent large jumps after stalls
    m_lastStep = std::min(delta, m_maxStep);
    m_simulationTime += m_lastStep;
    return m_lastStep;
}

void FrameClock::reset() {
    m_hasBaseline = false;
    m_lastStep = 0.0;
}

} // namespace FortressEngine
