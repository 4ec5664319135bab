/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"

#include <format>
#include <string>

namespace Ironclad {

namespace {

constexpr const char* kCategory = "collision";

template<typename T>
T readNonNegative(const SettingsManager& settings, const char* key, T fallback) {
    T value = settings.get<T>(kCategory, key, fallback);
    if (value < T{0}) {
        SETTINGS_WARNING(std::format("collision.{} must not be negative (got {}), using {}",
                                     key, value, fallback));
        return fallback;
    }
    return value;
}

} // anonymous namespace

CollisionConfig CollisionConfig::fromSettings(const SettingsManager& settings) {
    CollisionConfig config;
    config.minResolveDistance =
        readNonNegative(settings, "min_resolve_distance", DEFAULT_MIN_RESOLVE_DISTANCE);
    config.stationarySpeedEpsilon =
        readNonNegative(settings, "stationary_speed_epsilon", DEFAULT_STATIONARY_SPEED_EPSILON);
    config.stageRadius = readNonNegative(settings, "stage_radius", DEFAULT_STAGE_RADIUS);
    config.overlapCapacity =
        readNonNegative(settings, "default_overlap_capacity", DEFAULT_OVERLAP_CAPACITY);
    return config;
}

} // namespace Ironclad
