/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/OBBMath.hpp"

#include <cmath>

namespace Ironclad {
namespace OBBMath {

OBBAxes getAxes(const OBB& obb) {
    return OBBAxes{obb.rotation.right(), obb.rotation.up(), obb.rotation.forward()};
}

float projectionRadius(const OBB& obb, const Vector3D& axis) {
    const OBBAxes axes = getAxes(obb);
    return std::fabs((axes.right * obb.halfSize.getX()).dot(axis)) +
           std::fabs((axes.up * obb.halfSize.getY()).dot(axis)) +
           std::fabs((axes.forward * obb.halfSize.getZ()).dot(axis));
}

} // namespace OBBMath
} // namespace Ironclad
