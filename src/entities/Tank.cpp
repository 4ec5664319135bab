/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Tank.hpp"
#include "core/Logger.hpp"
#include "world/StageBoundary.hpp"

#include <algorithm>
#include <format>

namespace Ironclad {

Tank::Tank(const Vector3D& position, float yawRadians,
           const Vector3D& hitboxSize, const Vector3D& hitboxCenter)
    : m_id(nextEntityID()),
      m_position(position),
      m_rotation(Quaternion::fromYaw(yawRadians)),
      m_yaw(yawRadians),
      m_plannedPosition(position),
      m_plannedRotation(m_rotation),
      m_plannedYaw(yawRadians),
      m_hitboxSize(hitboxSize),
      m_hitboxCenter(hitboxCenter) {}

void Tank::planMovement(float deltaTime, float throttle, float turn, MovementLockAxis lockAxis) {
    if (m_broken) {
        m_forwardSpeed = 0.0f;
        m_plannedPosition = m_position;
        m_plannedRotation = m_rotation;
        m_plannedYaw = m_yaw;
        return;
    }

    throttle = std::clamp(throttle, -1.0f, 1.0f);
    turn = std::clamp(turn, -1.0f, 1.0f);

    m_plannedYaw = m_yaw + turn * m_turnRate * deltaTime;
    m_plannedRotation = Quaternion::fromYaw(m_plannedYaw);
    m_forwardSpeed = throttle * m_maxSpeed;

    Vector3D displacement = m_plannedRotation.forward() * (m_forwardSpeed * deltaTime);
    if (hasLockAxis(lockAxis, MovementLockAxis::X)) {
        displacement.setX(0.0f);
    }
    if (hasLockAxis(lockAxis, MovementLockAxis::Z)) {
        displacement.setZ(0.0f);
    }
    m_plannedPosition = m_position + displacement;
}

void Tank::constrainTo(const StageBoundary& boundary) {
    m_plannedPosition = boundary.clamp(m_plannedPosition);
}

void Tank::applyCollisionResolve(const CollisionResolveInfo& info) {
    if (m_broken || !info.isValid()) {
        return;
    }
    m_plannedPosition += info.getResolveVector();
}

void Tank::commitMovement() {
    m_position = m_plannedPosition;
    m_rotation = m_plannedRotation;
    m_yaw = m_plannedYaw;
}

void Tank::setPlannedPose(const Vector3D& position, const Quaternion& rotation) {
    m_plannedPosition = position;
    m_plannedRotation = rotation;
    m_plannedYaw = rotation.getYaw();
}

void Tank::setBroken(bool broken) {
    if (broken && !m_broken) {
        ENTITY_INFO(std::format("Tank {} is broken", m_id));
        m_forwardSpeed = 0.0f;
    }
    m_broken = broken;
}

} // namespace Ironclad
