/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/OverlapMath.hpp"
#include "collisions/OBBMath.hpp"

#include <algorithm>
#include <cmath>

namespace Ironclad {
namespace OverlapMath {

float overlapOnAxis(const OBB& a, const OBB& b, const Vector3D& axis) {
    const float radiusA = OBBMath::projectionRadius(a, axis);
    const float radiusB = OBBMath::projectionRadius(b, axis);
    const float distance = std::fabs((b.center - a.center).dot(axis));
    return radiusA + radiusB - distance;
}

bool isOverlappingOnAxis(const OBB& a, const OBB& b, const Vector3D& axis) {
    return overlapOnAxis(a, b, axis) > 0.0f;
}

bool tryCalculatePenetration(const OBB& a, const OBB& b, const Vector3D& axis, float& penetration) {
    penetration = overlapOnAxis(a, b, axis);
    return penetration > 0.0f;
}

float circleOBBHorizontalOverlap(const Vector3D& circleCenter, float radius, const OBB& obb) {
    const OBBMath::OBBAxes axes = OBBMath::getAxes(obb);
    const Vector3D boxCenter(obb.center.getX(), circleCenter.getY(), obb.center.getZ());
    const Vector3D delta = circleCenter - boxCenter;

    const float alongRight = std::clamp(delta.dot(axes.right), -obb.halfSize.getX(), obb.halfSize.getX());
    const float alongForward = std::clamp(delta.dot(axes.forward), -obb.halfSize.getZ(), obb.halfSize.getZ());
    const Vector3D closest = boxCenter + axes.right * alongRight + axes.forward * alongForward;

    return radius - Vector3D::horizontalDistance(circleCenter, closest);
}

} // namespace OverlapMath
} // namespace Ironclad
