/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TRANSACTION_FEED_HPP
#define TRANSACTION_FEED_HPP

#include <cstdint>
#include <random>
#include <string>

namespace FortressEngine {

class VisualizerHost;

struct FeedSettings {
    double transactionsPerSecond{1.5};
    double fraudRate{0.12};       // share of transactions decided review/block
    double meanAmount{200.0};
    double amountSigma{1.2};
    uint32_t pulseEvery{25};      // model refresh pulse cadence, 0 disables
    uint32_t maxBurst{4};         // emissions per update before the schedule re-baselines
    uint32_t seed{0xfeed};
};

/**
 * @brief Synthetic upstream for the demo: submits transactions to a host at
 * a fixed rate with log-normally distributed amounts.
 *
 * Deterministic for a given seed. update() catches up on emissions that fell
 * due since the previous call, at most maxBurst of them; a longer backlog
 * (stalled or backgrounded driver) is dropped and the schedule restarts from
 * the current time.
 */
class TransactionFeed {
public:
    TransactionFeed(VisualizerHost& host, const FeedSettings& settings = FeedSettings{});

    // @return number of transactions submitted during this call
    size_t update(double nowSeconds);

    uint64_t getEmittedCount() const { return m_emitted; }
    uint64_t getPulseCount() const { return m_pulses; }
    const FeedSettings& getSettings() const { return m_settings; }

private:
    void emitOne();
    std::string nextId();

    VisualizerHost& m_host;
    FeedSettings m_settings;
    std::mt19937 m_rng;
    std::lognormal_distribution<double> m_amounts;
    double m_nextEmitTime{0.0};
    bool m_started{false};
    uint64_t m_emitted{0};
    uint64_t m_pulses{0};
};

} // namespace FortressEngine

#endif // TRANSACTION_FEED_HPP
