/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESOLVE_CALCULATOR_HPP
#define COLLISION_RESOLVE_CALCULATOR_HPP

#include "collisions/CollisionConfig.hpp"
#include "collisions/CollisionResolveInfo.hpp"

namespace Ironclad {

class CollisionContext;

/**
 * @brief Splits the minimum translation vector between two bodies
 *
 * Each horizontal component of the MTV is assigned independently:
 *  - a body locked on that axis does not move, the other takes the push
 *  - otherwise the slower body (by |forward speed|, A on ties) absorbs it
 *  - if only one body is moving, the stationary one absorbs it
 *  - if neither is moving nobody is pushed
 * The MTV is oriented to point from B towards A before splitting.
 */
class CollisionResolveCalculator {
public:
    explicit CollisionResolveCalculator(const CollisionConfig& config = CollisionConfig{});

    /**
     * @brief Computes push-outs for a colliding pair
     *
     * Refreshes both contexts' bounds from their planned poses first.
     * @param bImmovable B is never pushed and counts as locked on every axis
     * @return false if the boxes do not overlap; outputs are then zero
     */
    bool calculateResolveInfo(CollisionContext& a, CollisionContext& b,
                              float speedA, float speedB, bool bImmovable,
                              CollisionResolveInfo& outA, CollisionResolveInfo& outB) const;

private:
    float m_minResolveDistance;
    float m_stationarySpeedEpsilon;

    bool isMoving(float speed) const;
    void snapToMinimum(Vector3D& push) const;
};

} // namespace Ironclad

#endif // COLLISION_RESOLVE_CALCULATOR_HPP
