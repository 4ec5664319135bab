/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef I_COLLISION_OWNER_HPP
#define I_COLLISION_OWNER_HPP

#include "utils/Quaternion.hpp"
#include "utils/Vector3D.hpp"

namespace Ironclad {

/**
 * @brief Pose source for a collision context
 *
 * Collision runs on the pose an entity intends to occupy at the end of the
 * frame, before that pose is committed.
 */
class ICollisionOwner {
public:
    virtual ~ICollisionOwner() = default;

    virtual Vector3D getPlannedNextPosition() const = 0;
    virtual Quaternion getPlannedNextRotation() const = 0;

    // Signed speed along the owner's forward axis, 0 for fixed bodies
    virtual float getForwardSpeed() const = 0;
};

} // namespace Ironclad

#endif // I_COLLISION_OWNER_HPP
