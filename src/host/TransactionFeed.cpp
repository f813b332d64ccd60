/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "host/TransactionFeed.hpp"
#include "core/Logger.hpp"
#include "host/VisualizerHost.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <string>

namespace FortressEngine {

namespace {
constexpr std::array<const char*, 4> TXN_TYPES = {"transfer", "deposit", "withdrawal", "payment"};
constexpr std::array<const char*, 4> CHANNELS = {"web", "mobile", "api", "branch"};
constexpr double MIN_AMOUNT = 5.0;
constexpr double MAX_AMOUNT = 25000.0;
} // namespace

TransactionFeed::TransactionFeed(VisualizerHost& host, const FeedSettings& settings)
    : m_host(host),
      m_settings(settings),
      m_rng(settings.seed),
      m_amounts(std::log(settings.meanAmount > 0.0 ? settings.meanAmount : 200.0),
                settings.amountSigma > 0.0 ? settings.amountSigma : 1.0)
{
    if (m_settings.transactionsPerSecond <= 0.0) {
        FEED_WARN("Non-positive feed rate, defaulting to 1.5 tx/s");
        m_settings.transactionsPerSecond = 1.5;
    }
    if (m_settings.maxBurst == 0) {
        FEED_WARN("maxBurst of 0 would stall the feed, using 1");
        m_settings.maxBurst = 1;
    }
}

size_t TransactionFeed::update(double nowSeconds) {
    if (!std::isfinite(nowSeconds) || !m_host.isRunning()) {
        return 0;
    }
    if (!m_started) {
        m_started = true;
        m_nextEmitTime = nowSeconds;
    }

    const double interval = 1.0 / m_settings.transactionsPerSecond;
    size_t submitted = 0;
    while (nowSeconds >= m_nextEmitTime && submitted < m_settings.maxBurst) {
        emitOne();
        m_nextEmitTime += interval;
        ++submitted;
    }

    if (nowSeconds >= m_nextEmitTime) {
        FEED_WARN("Feed fell behind, dropping backlog of " +
                  std::to_string(static_cast<uint64_t>((nowSeconds - m_nextEmitTime) / interval) + 1) +
                  " transactions");
        m_nextEmitTime = nowSeconds + interval;
    }
    return submitted;
}

void TransactionFeed::emitOne() {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_int_distribution<size_t> pickType(0, TXN_TYPES.size() - 1);
    std::uniform_int_distribution<size_t> pickChannel(0, CHANNELS.size() - 1);

    const std::string id = nextId();
    double amount = m_amounts(m_rng);
    amount = std::round(std::min(std::max(amount, MIN_AMOUNT), MAX_AMOUNT) * 100.0) / 100.0;

    const bool fraudulent = unit(m_rng) < m_settings.fraudRate;
    std::string decision = "approve";
    double score = unit(m_rng) * 0.4;
    if (fraudulent) {
        decision = unit(m_rng) < 0.5 ? "review" : "block";
        score = 0.6 + unit(m_rng) * 0.4;
    }

    JsonObject metadata;
    metadata["txn_type"] = JsonValue(TXN_TYPES[pickType(m_rng)]);
    metadata["channel"] = JsonValue(CHANNELS[pickChannel(m_rng)]);
    metadata["amount"] = JsonValue(amount);

    if (m_host.submitTransaction(id, amount, std::move(metadata), decision, score)) {
        FEED_DEBUG("Submitted " + id + " (" + decision + ")");
    } else {
        FEED_WARN("Host rejected synthetic transaction " + id);
    }
    ++m_emitted;

    if (m_settings.pulseEvery > 0 && m_emitted % m_settings.pulseEvery == 0) {
        m_host.triggerPulse();
        ++m_pulses;
        FEED_INFO("Model refresh pulse after " + std::to_string(m_emitted) + " transactions");
    }
}

std::string TransactionFeed::nextId() {
    std::uniform_int_distribution<uint32_t> word;
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "txn-%08x-%06llu", word(m_rng),
                  static_cast<unsigned long long>(m_emitted));
    return std::string(buffer);
}

} // namespace FortressEngine
