/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OBB_MATH_HPP
#define OBB_MATH_HPP

#include "collisions/OBB.hpp"
#include "utils/Vector3D.hpp"

namespace Ironclad {
namespace OBBMath {

// World-space unit axes of a box
struct OBBAxes {
    Vector3D right;
    Vector3D up;
    Vector3D forward;
};

OBBAxes getAxes(const OBB& obb);

/**
 * @brief Half-length of the box's shadow on an axis
 * @param axis Must be normalized
 */
float projectionRadius(const OBB& obb, const Vector3D& axis);

} // namespace OBBMath
} // namespace Ironclad

#endif // OBB_MATH_HPP
