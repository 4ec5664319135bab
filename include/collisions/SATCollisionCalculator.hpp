/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SAT_COLLISION_CALCULATOR_HPP
#define SAT_COLLISION_CALCULATOR_HPP

#include "collisions/OBB.hpp"
#include "utils/Vector3D.hpp"

#include <span>
#include <vector>

namespace Ironclad {

/**
 * @brief Separating-axis tests restricted to the horizontal plane
 *
 * Candidate axes are, in order: A.forward, A.right, B.forward, B.right.
 * The vertical axis is never tested, so boxes stacked in Y still collide.
 */
namespace SATCollisionCalculator {

bool isCollidingHorizontal(const OBB& a, const OBB& b);

/**
 * @brief Finds the minimum translation axis between two boxes
 * @param outAxis Unit axis of least penetration, unoriented
 * @param outOverlap Penetration depth along outAxis
 * @return false if any candidate axis separates the boxes
 */
bool tryGetPushOutAxisAndDistance(const OBB& a, const OBB& b, Vector3D& outAxis, float& outOverlap);

/**
 * @brief Collects every box the circle overlaps on the horizontal plane
 *
 * results is cleared first; null entries in boxes are skipped and input
 * order is preserved.
 */
void collectOverlappingCircleHorizontal(const Vector3D& center, float radius,
                                        std::span<const OBB* const> boxes,
                                        std::vector<const OBB*>& results);

} // namespace SATCollisionCalculator
} // namespace Ironclad

#endif // SAT_COLLISION_CALCULATOR_HPP
