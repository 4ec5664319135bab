/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionResolveCalculator.hpp"
#include "collisions/CollisionContext.hpp"
#include "collisions/SATCollisionCalculator.hpp"

#include <cmath>

namespace Ironclad {

namespace {

struct AxisPush {
    float a{0.0f};
    float b{0.0f};
};

} // anonymous namespace

CollisionResolveCalculator::CollisionResolveCalculator(const CollisionConfig& config)
    : m_minResolveDistance(config.minResolveDistance),
      m_stationarySpeedEpsilon(config.stationarySpeedEpsilon) {}

bool CollisionResolveCalculator::isMoving(float speed) const {
    return std::fabs(speed) > m_stationarySpeedEpsilon;
}

void CollisionResolveCalculator::snapToMinimum(Vector3D& push) const {
    const float distance = push.length();
    if (distance > 0.0f && distance < m_minResolveDistance) {
        push *= m_minResolveDistance / distance;
    }
}

bool CollisionResolveCalculator::calculateResolveInfo(CollisionContext& a, CollisionContext& b,
                                                      float speedA, float speedB, bool bImmovable,
                                                      CollisionResolveInfo& outA,
                                                      CollisionResolveInfo& outB) const {
    outA = CollisionResolveInfo();
    outB = CollisionResolveInfo();

    a.updateOBB();
    b.updateOBB();

    const MovementLockAxis lockA = a.getLockAxis();
    const MovementLockAxis lockB = bImmovable ? MovementLockAxis::All : b.getLockAxis();

    Vector3D axis;
    float overlap = 0.0f;
    if (!SATCollisionCalculator::tryGetPushOutAxisAndDistance(a.getOBB(), b.getOBB(), axis, overlap)) {
        return false;
    }

    const Vector3D fromBToA = (a.getOBB().center - b.getOBB().center).horizontal();
    if (axis.dot(fromBToA) < 0.0f) {
        axis = -axis;
    }

    const bool aMoving = isMoving(speedA);
    const bool bMoving = isMoving(speedB);

    auto splitComponent = [&](float value, MovementLockAxis component) {
        AxisPush push;
        if (hasLockAxis(lockA, component)) {
            if (!bImmovable) {
                push.b = -value;
            }
        } else if (hasLockAxis(lockB, component)) {
            push.a = value;
        } else if (aMoving && bMoving) {
            if (std::fabs(speedA) <= std::fabs(speedB)) {
                push.a = value;
            } else {
                push.b = -value;
            }
        } else if (aMoving) {
            push.b = -value;
        } else if (bMoving) {
            push.a = value;
        }
        return push;
    };

    const Vector3D mtv = axis * overlap;
    const AxisPush pushX = splitComponent(mtv.getX(), MovementLockAxis::X);
    const AxisPush pushZ = splitComponent(mtv.getZ(), MovementLockAxis::Z);

    Vector3D resolveA(pushX.a, 0.0f, pushZ.a);
    Vector3D resolveB(pushX.b, 0.0f, pushZ.b);
    snapToMinimum(resolveA);
    snapToMinimum(resolveB);

    outA = CollisionResolveInfo(resolveA);
    outB = CollisionResolveInfo(resolveB);
    return true;
}

} // namespace Ironclad
