/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/SATCollisionCalculator.hpp"
#include "collisions/OBBMath.hpp"
#include "collisions/OverlapMath.hpp"

#include <array>
#include <limits>

namespace Ironclad {
namespace SATCollisionCalculator {

namespace {

std::array<Vector3D, 4> horizontalAxes(const OBB& a, const OBB& b) {
    const OBBMath::OBBAxes axesA = OBBMath::getAxes(a);
    const OBBMath::OBBAxes axesB = OBBMath::getAxes(b);
    return {axesA.forward, axesA.right, axesB.forward, axesB.right};
}

} // anonymous namespace

bool isCollidingHorizontal(const OBB& a, const OBB& b) {
    for (const Vector3D& axis : horizontalAxes(a, b)) {
        if (!OverlapMath::isOverlappingOnAxis(a, b, axis)) {
            return false;
        }
    }
    return true;
}

bool tryGetPushOutAxisAndDistance(const OBB& a, const OBB& b, Vector3D& outAxis, float& outOverlap) {
    outAxis = Vector3D();
    outOverlap = std::numeric_limits<float>::max();

    for (const Vector3D& candidate : horizontalAxes(a, b)) {
        const Vector3D axis = candidate.normalized();
        float penetration = 0.0f;
        if (!OverlapMath::tryCalculatePenetration(a, b, axis, penetration)) {
            return false;
        }
        // Strict comparison keeps the earliest axis on ties
        if (penetration < outOverlap) {
            outOverlap = penetration;
            outAxis = axis;
        }
    }

    return !outAxis.isZero();
}

void collectOverlappingCircleHorizontal(const Vector3D& center, float radius,
                                        std::span<const OBB* const> boxes,
                                        std::vector<const OBB*>& results) {
    results.clear();
    for (const OBB* box : boxes) {
        if (box == nullptr) {
            continue;
        }
        if (OverlapMath::circleOBBHorizontalOverlap(center, radius, *box) > 0.0f) {
            results.push_back(box);
        }
    }
}

} // namespace SATCollisionCalculator
} // namespace Ironclad
