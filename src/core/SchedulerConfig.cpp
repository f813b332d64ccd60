/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SchedulerConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <unordered_map>

namespace FortressEngine {

namespace {

using Setter = std::function<bool(SchedulerConfig&, const JsonValue&)>;

Setter numberField(double SchedulerConfig::*field) {
    return [field](SchedulerConfig& cfg, const JsonValue& value) {
        auto number = value.tryAsNumber();
        if (!number) {
            return false;
        }
        cfg.*field = *number;
        return true;
    };
}

Setter floatField(float SchedulerConfig::*field) {
    return [field](SchedulerConfig& cfg, const JsonValue& value) {
        auto number = value.tryAsNumber();
        if (!number) {
            return false;
        }
        cfg.*field = static_cast<float>(*number);
        return true;
    };
}

Setter countField(size_t SchedulerConfig::*field) {
    return [field](SchedulerConfig& cfg, const JsonValue& value) {
        auto number = value.tryAsNumber();
        // 2^64 itself is representable and already out of range
        if (!number || !std::isfinite(*number) || *number < 0.0 ||
            *number >= static_cast<double>(std::numeric_limits<size_t>::max())) {
            return false;
        }
        cfg.*field = static_cast<size_t>(*number);
        return true;
    };
}

using CategoryTable = std::unordered_map<std::string, Setter>;

const std::unordered_map<std::string, CategoryTable>& settingTables() {
    static const std::unordered_map<std::string, CategoryTable> tables = {
        {"durations",
         {{"spawn", numberField(&SchedulerConfig::spawnDuration)},
          {"scan_ramp", numberField(&SchedulerConfig::scanRampDuration)},
          {"flag_shake", numberField(&SchedulerConfig::flagShakeDuration)},
          {"flag_exit", numberField(&SchedulerConfig::flagExitDuration)},
          {"clear", numberField(&SchedulerConfig::clearDuration)},
          {"land", numberField(&SchedulerConfig::landDuration)}}},
        {"limits",
         {{"max_transit", countField(&SchedulerConfig::maxTransitEntities)},
          {"max_growth", countField(&SchedulerConfig::maxGrowthEntities)},
          {"max_frame_step", numberField(&SchedulerConfig::maxFrameStep)}}},
        {"motion",
         {{"orbit_angular_speed", numberField(&SchedulerConfig::orbitAngularSpeed)},
          {"orbit_radius_factor", floatField(&SchedulerConfig::orbitRadiusFactor)},
          {"flag_exit_base_speed", floatField(&SchedulerConfig::flagExitBaseSpeed)},
          {"flag_exit_speed_gain", floatField(&SchedulerConfig::flagExitSpeedGain)},
          {"scan_sweep_speed", numberField(&SchedulerConfig::scanSweepSpeed)},
          {"hit_padding", floatField(&SchedulerConfig::hitPadding)}}},
        {"growth",
         {{"period", numberField(&SchedulerConfig::growthPeriod)},
          {"columns", countField(&SchedulerConfig::growthColumns)}}},
        {"effects",
         {{"pulse_lifetime", numberField(&SchedulerConfig::pulseLifetime)},
          {"burst_lifetime", numberField(&SchedulerConfig::burstLifetime)},
          {"burst_radius", floatField(&SchedulerConfig::burstRadius)}}},
        {"behaviour",
         {{"allow_early_classification",
           [](SchedulerConfig& cfg, const JsonValue& value) {
               auto flag = value.tryAsBool();
               if (!flag) {
                   return false;
               }
               cfg.allowEarlyClassification = *flag;
               return true;
           }},
          {"category_key",
           [](SchedulerConfig& cfg, const JsonValue& value) {
               auto key = value.tryAsString();
               if (!key) {
                   return false;
               }
               cfg.categoryKey = *key;
               return true;
           }},
          {"random_seed",
           [](SchedulerConfig& cfg, const JsonValue& value) {
               auto number = value.tryAsNumber();
               if (!number || !std::isfinite(*number) || *number < 0.0 ||
                   *number > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
                   return false;
               }
               cfg.randomSeed = static_cast<uint32_t>(*number);
               return true;
           }}}},
    };
    return tables;
}

} // namespace

bool SchedulerConfig::applyJson(const JsonValue& root) {
    const JsonObject* rootObj = root.tryAsObject();
    if (rootObj == nullptr) {
        CONFIG_ERROR("Config root is not a JSON object");
        return false;
    }

    const auto& tables = settingTables();
    for (const auto& [categoryName, categoryValue] : *rootObj) {
        auto tableIt = tables.find(categoryName);
        if (tableIt == tables.end()) {
            CONFIG_WARN("Unknown config category '" + categoryName + "', skipping");
            continue;
        }

        const JsonObject* categoryObj = categoryValue.tryAsObject();
        if (categoryObj == nullptr) {
            CONFIG_WARN("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *categoryObj) {
            auto setterIt = tableIt->second.find(key);
            if (setterIt == tableIt->second.end()) {
                CONFIG_WARN("Unknown setting '" + categoryName + "." + key + "', skipping");
                continue;
            }
            if (!setterIt->second(*this, value)) {
                CONFIG_WARN("Wrong value type or out of range for setting '" + categoryName + "." + key + "', skipping");
            }
        }
    }
    return true;
}

bool SchedulerConfig::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        CONFIG_ERROR("Failed to load config from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    SchedulerConfig candidate = *this;
    if (!candidate.applyJson(reader.getRoot())) {
        CONFIG_ERROR("Config file root is not a JSON object: " + filepath);
        return false;
    }
    if (!candidate.isValid()) {
        CONFIG_ERROR("Config file has out-of-range values, keeping previous config: " + filepath);
        return false;
    }

    *this = std::move(candidate);
    CONFIG_INFO("Loaded scheduler config from file: " + filepath);
    return true;
}

bool SchedulerConfig::isValid() const {
    return spawnDuration > 0.0 && scanRampDuration > 0.0 &&
           flagShakeDuration >= 0.0 && flagExitDuration > 0.0 &&
           clearDuration > 0.0 && landDuration > 0.0 && maxFrameStep > 0.0 &&
           growthPeriod > 0.0 && growthColumns > 0 && pulseLifetime > 0.0 &&
           burstLifetime > 0.0;
}

} // namespace FortressEngine
