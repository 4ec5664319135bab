/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TANK_HPP
#define TANK_HPP

#include "collisions/CollisionResolveInfo.hpp"
#include "collisions/ICollisionOwner.hpp"
#include "collisions/MovementLockAxis.hpp"
#include "entities/EntityID.hpp"
#include "utils/Quaternion.hpp"
#include "utils/Vector3D.hpp"

namespace Ironclad {

class StageBoundary;

/**
 * @brief Player or AI vehicle driven by throttle and turn input
 *
 * Each frame the tank plans a pose, the collision pass pushes the plan out
 * of whatever it hits, and commitMovement() makes the plan current.
 */
class Tank : public ICollisionOwner {
public:
    Tank(const Vector3D& position, float yawRadians,
         const Vector3D& hitboxSize, const Vector3D& hitboxCenter = Vector3D());
    ~Tank() override = default;

    EntityID getID() const { return m_id; }

    /**
     * @brief Computes the planned pose for this frame
     * @param throttle Forward input in [-1, 1]
     * @param turn Turn input in [-1, 1], positive turns right
     * @param lockAxis Committed lock from the previous collision pass; the
     *                 displacement along locked world axes is dropped
     */
    void planMovement(float deltaTime, float throttle, float turn, MovementLockAxis lockAxis);

    // Pulls the planned position back inside the arena
    void constrainTo(const StageBoundary& boundary);

    // Adds a collision push-out to the planned position. Broken tanks are not moved.
    void applyCollisionResolve(const CollisionResolveInfo& info);

    void commitMovement();

    // ICollisionOwner
    Vector3D getPlannedNextPosition() const override { return m_plannedPosition; }
    Quaternion getPlannedNextRotation() const override { return m_plannedRotation; }
    float getForwardSpeed() const override { return m_forwardSpeed; }

    const Vector3D& getPosition() const { return m_position; }
    const Quaternion& getRotation() const { return m_rotation; }
    void setPlannedPose(const Vector3D& position, const Quaternion& rotation);
    void setForwardSpeed(float speed) { m_forwardSpeed = speed; }

    const Vector3D& getHitboxSize() const { return m_hitboxSize; }
    const Vector3D& getHitboxCenter() const { return m_hitboxCenter; }

    float getMaxSpeed() const { return m_maxSpeed; }
    void setMaxSpeed(float speed) { m_maxSpeed = speed; }
    float getTurnRate() const { return m_turnRate; }
    void setTurnRate(float radiansPerSecond) { m_turnRate = radiansPerSecond; }

    bool isBroken() const { return m_broken; }
    void setBroken(bool broken);

private:
    EntityID m_id;
    Vector3D m_position;
    Quaternion m_rotation;
    float m_yaw{0.0f};
    Vector3D m_plannedPosition;
    Quaternion m_plannedRotation;
    float m_plannedYaw{0.0f};
    float m_forwardSpeed{0.0f};
    Vector3D m_hitboxSize;
    Vector3D m_hitboxCenter;
    float m_maxSpeed{8.0f};
    float m_turnRate{2.0f};
    bool m_broken{false};
};

} // namespace Ironclad

#endif // TANK_HPP
