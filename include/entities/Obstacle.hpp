/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OBSTACLE_HPP
#define OBSTACLE_HPP

#include "collisions/ICollisionOwner.hpp"
#include "entities/EntityID.hpp"
#include "utils/Quaternion.hpp"
#include "utils/Vector3D.hpp"

namespace Ironclad {

// Fixed scenery collider. Bases block tanks but are ignored by bullets.
class Obstacle : public ICollisionOwner {
public:
    Obstacle(const Vector3D& position, float yawRadians, const Vector3D& size,
             const Vector3D& localCenter = Vector3D(), bool isBase = false)
        : m_id(nextEntityID()),
          m_position(position),
          m_rotation(Quaternion::fromYaw(yawRadians)),
          m_size(size),
          m_localCenter(localCenter),
          m_isBase(isBase) {}
    ~Obstacle() override = default;

    EntityID getID() const { return m_id; }
    const Vector3D& getPosition() const { return m_position; }
    const Quaternion& getRotation() const { return m_rotation; }
    const Vector3D& getSize() const { return m_size; }
    const Vector3D& getLocalCenter() const { return m_localCenter; }
    bool isBase() const { return m_isBase; }

    Vector3D getPlannedNextPosition() const override { return m_position; }
    Quaternion getPlannedNextRotation() const override { return m_rotation; }
    float getForwardSpeed() const override { return 0.0f; }

private:
    EntityID m_id;
    Vector3D m_position;
    Quaternion m_rotation;
    Vector3D m_size;
    Vector3D m_localCenter;
    bool m_isBase;
};

} // namespace Ironclad

#endif // OBSTACLE_HPP
