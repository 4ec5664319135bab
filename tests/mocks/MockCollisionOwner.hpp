/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MOCK_COLLISION_OWNER_HPP
#define MOCK_COLLISION_OWNER_HPP

#include "collisions/ICollisionOwner.hpp"
#include "utils/Quaternion.hpp"
#include "utils/Vector3D.hpp"

// Pose source with directly settable planned pose and speed
class MockCollisionOwner : public Ironclad::ICollisionOwner {
public:
    MockCollisionOwner() = default;
    MockCollisionOwner(const Ironclad::Vector3D& position, float yawRadians, float speed = 0.0f)
        : m_position(position), m_rotation(Ironclad::Quaternion::fromYaw(yawRadians)), m_speed(speed) {}

    Ironclad::Vector3D getPlannedNextPosition() const override { return m_position; }
    Ironclad::Quaternion getPlannedNextRotation() const override { return m_rotation; }
    float getForwardSpeed() const override { return m_speed; }

    void setPosition(const Ironclad::Vector3D& position) { m_position = position; }
    void setYaw(float yawRadians) { m_rotation = Ironclad::Quaternion::fromYaw(yawRadians); }
    void setSpeed(float speed) { m_speed = speed; }

private:
    Ironclad::Vector3D m_position;
    Ironclad::Quaternion m_rotation;
    float m_speed{0.0f};
};

#endif // MOCK_COLLISION_OWNER_HPP
