/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Bullet.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace Ironclad {

Bullet::Bullet(EntityID shooterId, BulletKind kind, const Vector3D& position,
               float yawRadians, float speed, const Vector3D& size)
    : m_id(nextEntityID()),
      m_shooterId(shooterId),
      m_kind(kind),
      m_position(position),
      m_yaw(yawRadians),
      m_plannedPosition(position),
      m_plannedYaw(yawRadians),
      m_speed(speed),
      m_size(size) {}

float Bullet::steerTowardsTarget(float deltaTime) const {
    const auto* homing = std::get_if<HomingBullet>(&m_kind);
    if (homing == nullptr || !m_homingTarget) {
        return m_yaw;
    }

    const Vector3D toTarget = (*m_homingTarget - m_position).horizontal();
    if (toTarget.lengthSquared() <= Vector3D::EPSILON) {
        return m_yaw;
    }

    const float desired = std::atan2(toTarget.getX(), toTarget.getZ());
    constexpr float pi = std::numbers::pi_v<float>;
    float delta = std::remainder(desired - m_yaw, 2.0f * pi); // [-pi, pi]
    const float maxTurn = homing->turnRateDegrees * (pi / 180.0f) * deltaTime;
    delta = std::clamp(delta, -maxTurn, maxTurn);
    return m_yaw + delta;
}

void Bullet::planMovement(float deltaTime) {
    m_plannedYaw = steerTowardsTarget(deltaTime);
    m_plannedPosition = m_position + Quaternion::fromYaw(m_plannedYaw).forward() * (m_speed * deltaTime);
}

void Bullet::commitMovement() {
    m_position = m_plannedPosition;
    m_yaw = m_plannedYaw;
}

} // namespace Ironclad
