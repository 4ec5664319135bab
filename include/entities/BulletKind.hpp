/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BULLET_KIND_HPP
#define BULLET_KIND_HPP

#include <cstdint>
#include <variant>

namespace Ironclad {

// Detonates on first contact and damages everything inside blastRadius
struct ExplosiveBullet {
    float damage{0.0f};
    float blastRadius{0.0f};
};

// Passes through tanks until maxTargets distinct targets were hit; stopped by obstacles
struct PenetrationBullet {
    float damage{0.0f};
    uint32_t maxTargets{1};
};

// Steers towards a target point, despawns on first hit
struct HomingBullet {
    float damage{0.0f};
    float turnRateDegrees{0.0f};
};

using BulletKind = std::variant<ExplosiveBullet, PenetrationBullet, HomingBullet>;

inline float getDamage(const BulletKind& kind) {
    return std::visit([](const auto& k) { return k.damage; }, kind);
}

} // namespace Ironclad

#endif // BULLET_KIND_HPP
