/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SCHEDULER_CONFIG_HPP
#define SCHEDULER_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace FortressEngine {

class JsonValue;

/**
 * @brief Tunables for the lifecycle scheduler, all times in seconds and all
 * distances in canvas pixels.
 *
 * Defaults reproduce the shipped visual behaviour; a JSON file can override
 * any subset:
 *
 *   {
 *     "durations": { "spawn": 2.0, "clear": 1.5 },
 *     "limits":    { "max_transit": 50, "max_growth": 30 },
 *     "behaviour": { "allow_early_classification": false }
 *   }
 */
struct SchedulerConfig {
    // durations
    double spawnDuration{2.0};
    double scanRampDuration{1.0};
    double flagShakeDuration{0.5};
    double flagExitDuration{1.0};
    double clearDuration{1.5};
    double landDuration{0.6};

    // limits
    size_t maxTransitEntities{50};
    size_t maxGrowthEntities{30};
    double maxFrameStep{0.1};

    // motion
    double orbitAngularSpeed{2.5};
    float orbitRadiusFactor{0.3f};
    float flagExitBaseSpeed{400.0f};
    float flagExitSpeedGain{300.0f};
    double scanSweepSpeed{0.8};
    float hitPadding{8.0f};

    // growth
    double growthPeriod{24.0};
    size_t growthColumns{6};

    // effects
    double pulseLifetime{1.5};
    double burstLifetime{1.5};
    float burstRadius{30.0f};

    // behaviour
    bool allowEarlyClassification{true};
    std::string categoryKey{"txn_type"};
    uint32_t randomSeed{0x5eed};

    /**
     * @brief Overlays values from a parsed JSON document onto this config
     * @return false if the root is not an object; individual bad keys are
     * skipped with a warning
     */
    bool applyJson(const JsonValue& root);

    /**
     * @brief Loads overrides from a JSON file on top of the current values
     * @return false (and leaves this config untouched) when the file cannot
     * be read or parsed
     */
    bool loadFromFile(const std::string& filepath);

    // Rejects non-positive durations and zero-sized grids
    bool isValid() const;
};

} // namespace FortressEngine

#endif // SCHEDULER_CONFIG_HPP
