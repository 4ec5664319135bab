/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_CONFIG_HPP
#define COLLISION_CONFIG_HPP

#include <cstddef>

namespace Ironclad {

class SettingsManager;

// Tunables read from the "collision" settings category
struct CollisionConfig {
    static constexpr float DEFAULT_MIN_RESOLVE_DISTANCE = 0.001f;
    static constexpr float DEFAULT_STATIONARY_SPEED_EPSILON = 1e-6f;
    static constexpr float DEFAULT_STAGE_RADIUS = 0.0f;
    static constexpr int DEFAULT_OVERLAP_CAPACITY = 32;

    // Shortest non-zero push ever emitted; smaller pushes are scaled up to it
    float minResolveDistance{DEFAULT_MIN_RESOLVE_DISTANCE};
    // |speed| at or below this counts as standing still
    float stationarySpeedEpsilon{DEFAULT_STATIONARY_SPEED_EPSILON};
    // Radius of the circular arena, 0 disables the boundary
    float stageRadius{DEFAULT_STAGE_RADIUS};
    // Initial capacity of per-kind context arrays and query buffers
    int overlapCapacity{DEFAULT_OVERLAP_CAPACITY};

    /**
     * @brief Reads the "collision" category, keeping defaults for missing keys
     *
     * Negative values are rejected with a warning and replaced by the default.
     */
    static CollisionConfig fromSettings(const SettingsManager& settings);
};

} // namespace Ironclad

#endif // COLLISION_CONFIG_HPP
