/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FRAME_CLOCK_HPP
#define FRAME_CLOCK_HPP

#include <cstdint>

namespace FortressEngine {

/**
 * FrameClock turns the wall-clock timestamps handed in by the frame driver
 * into a bounded simulation step.
 *
 * - The first timestamp only establishes the baseline (step 0).
 * - Steps are clamped to maxStep so a stalled or backgrounded driver cannot
 *   push an entity through several states in one tick.
 * - A timestamp that goes backwards yields a zero step and re-baselines.
 *
 * Simulation time is the sum of clamped steps, so it never runs ahead of
 * the driver and never goes backwards.
 */
class FrameClock {
public:
    explicit FrameClock(double maxStep = 0.1);

    /**
     * Feed the next driver timestamp
     * @param timestampSeconds driver time in seconds
     * @return the clamped step applied to simulation time
     */
    double advance(double timestampSeconds);

    double getSimulationTime() const { return m_simulationTime; }
    double getLastStep() const { return m_lastStep; }
    double getMaxStep() const { return m_maxStep; }
    uint64_t getFrameCount() const { return m_frameCount; }
    uint64_t getRegressionCount() const { return m_regressionCount; }
    bool hasBaseline() const { return m_hasBaseline; }

    // Forget the baseline; the next advance() starts a fresh step sequence
    void reset();

private:
    double m_maxStep;
    double m_lastTimestamp{0.0};
    double m_simulationTime{0.0};
    double m_lastStep{0.0};
    uint64_t m_frameCount{0};
    uint64_t m_regressionCount{0};
    bool m_hasBaseline{false};
};

} // namespace FortressEngine

#endif // FRAME_CLOCK_HPP
