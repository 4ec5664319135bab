/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BULLET_HPP
#define BULLET_HPP

#include "collisions/ICollisionOwner.hpp"
#include "entities/BulletKind.hpp"
#include "entities/EntityID.hpp"
#include "utils/Quaternion.hpp"
#include "utils/Vector3D.hpp"

#include <optional>

namespace Ironclad {

// Projectile flying along its forward axis at constant speed
class Bullet : public ICollisionOwner {
public:
    Bullet(EntityID shooterId, BulletKind kind, const Vector3D& position,
           float yawRadians, float speed, const Vector3D& size);
    ~Bullet() override = default;

    EntityID getID() const { return m_id; }
    EntityID getShooterID() const { return m_shooterId; }
    const BulletKind& getKind() const { return m_kind; }
    float getDamage() const { return Ironclad::getDamage(m_kind); }
    const Vector3D& getSize() const { return m_size; }

    const Vector3D& getPosition() const { return m_position; }
    float getYaw() const { return m_yaw; }

    // Only homing bullets steer; other kinds ignore the target
    void setHomingTarget(const Vector3D& target) { m_homingTarget = target; }
    void clearHomingTarget() { m_homingTarget.reset(); }

    void planMovement(float deltaTime);
    void commitMovement();

    Vector3D getPlannedNextPosition() const override { return m_plannedPosition; }
    Quaternion getPlannedNextRotation() const override { return Quaternion::fromYaw(m_plannedYaw); }
    float getForwardSpeed() const override { return m_speed; }

private:
    EntityID m_id;
    EntityID m_shooterId;
    BulletKind m_kind;
    Vector3D m_position;
    float m_yaw;
    Vector3D m_plannedPosition;
    float m_plannedYaw;
    float m_speed;
    Vector3D m_size;
    std::optional<Vector3D> m_homingTarget;

    float steerTowardsTarget(float deltaTime) const;
};

} // namespace Ironclad

#endif // BULLET_HPP
