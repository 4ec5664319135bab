/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef QUATERNION_HPP
#define QUATERNION_HPP

#include "utils/Vector3D.hpp"

#include <cmath>
#include <numbers>

namespace Ironclad {

/**
 * @brief Unit quaternion for orientations
 *
 * Gameplay code only builds yaw rotations (about +Y). A positive yaw turns
 * +Z (forward) towards +X (right), i.e. clockwise seen from above.
 */
class Quaternion {
public:
    Quaternion() : m_x(0.0f), m_y(0.0f), m_z(0.0f), m_w(1.0f) {}
    Quaternion(float x, float y, float z, float w) : m_x(x), m_y(y), m_z(z), m_w(w) {}

    static Quaternion identity() { return Quaternion(); }

    static Quaternion fromYaw(float radians) {
        float half = radians * 0.5f;
        return Quaternion(0.0f, std::sin(half), 0.0f, std::cos(half));
    }

    static Quaternion fromYawDegrees(float degrees) {
        return fromYaw(degrees * (std::numbers::pi_v<float> / 180.0f));
    }

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    float getZ() const { return m_z; }
    float getW() const { return m_w; }

    // Heading of the rotated forward axis on the XZ plane, in radians
    float getYaw() const {
        Vector3D f = forward();
        return std::atan2(f.getX(), f.getZ());
    }

    Vector3D rotate(const Vector3D& v) const {
        // v' = v + 2w(u x v) + 2u x (u x v)
        Vector3D u(m_x, m_y, m_z);
        Vector3D t = u.cross(v) * 2.0f;
        return v + t * m_w + u.cross(t);
    }

    Vector3D right() const { return rotate(Vector3D(1.0f, 0.0f, 0.0f)); }
    Vector3D up() const { return rotate(Vector3D(0.0f, 1.0f, 0.0f)); }
    Vector3D forward() const { return rotate(Vector3D(0.0f, 0.0f, 1.0f)); }

    Quaternion operator*(const Quaternion& q) const {
        return Quaternion(
            m_w * q.m_x + m_x * q.m_w + m_y * q.m_z - m_z * q.m_y,
            m_w * q.m_y - m_x * q.m_z + m_y * q.m_w + m_z * q.m_x,
            m_w * q.m_z + m_x * q.m_y - m_y * q.m_x + m_z * q.m_w,
            m_w * q.m_w - m_x * q.m_x - m_y * q.m_y - m_z * q.m_z);
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
    float m_z{0.0f};
    float m_w{1.0f};
};

} // namespace Ironclad

#endif // QUATERNION_HPP
