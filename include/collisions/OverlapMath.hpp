/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OVERLAP_MATH_HPP
#define OVERLAP_MATH_HPP

#include "collisions/OBB.hpp"
#include "utils/Vector3D.hpp"

namespace Ironclad {
namespace OverlapMath {

// Positive result is the penetration depth along axis, <= 0 means separated.
// axis must be normalized.
float overlapOnAxis(const OBB& a, const OBB& b, const Vector3D& axis);

bool isOverlappingOnAxis(const OBB& a, const OBB& b, const Vector3D& axis);

/**
 * @brief Writes the overlap on axis into penetration
 * @return true if the boxes penetrate along axis
 */
bool tryCalculatePenetration(const OBB& a, const OBB& b, const Vector3D& axis, float& penetration);

/**
 * @brief Horizontal overlap between a circle and a box
 *
 * The box is treated as a rectangle lying at the circle's height.
 * @return radius minus the distance to the closest point on the rectangle;
 *         positive when they overlap
 */
float circleOBBHorizontalOverlap(const Vector3D& circleCenter, float radius, const OBB& obb);

} // namespace OverlapMath
} // namespace Ironclad

#endif // OVERLAP_MATH_HPP
