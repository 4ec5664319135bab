/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_3D_HPP
#define VECTOR_3D_HPP

#include <cmath>
#include <ostream>

namespace Ironclad {

// World-space 3D vector. Y is up; gameplay happens on the XZ plane.
class Vector3D {
public:
    static constexpr float EPSILON = 1e-5f;

    Vector3D() : m_x(0.0f), m_y(0.0f), m_z(0.0f) {}
    Vector3D(float x, float y, float z) : m_x(x), m_y(y), m_z(z) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    float getZ() const { return m_z; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }
    void setZ(float z) { m_z = z; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y + m_z * m_z; }

    // Zero vector for lengths below EPSILON
    Vector3D normalized() const {
        float len = length();
        if (len <= EPSILON) return Vector3D();
        float invLen = 1.0f / len;
        return Vector3D(m_x * invLen, m_y * invLen, m_z * invLen);
    }

    float dot(const Vector3D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y + m_z * v2.m_z;
    }

    Vector3D cross(const Vector3D& v2) const {
        return Vector3D(m_y * v2.m_z - m_z * v2.m_y,
                        m_z * v2.m_x - m_x * v2.m_z,
                        m_x * v2.m_y - m_y * v2.m_x);
    }

    // Projection onto the horizontal plane (Y dropped)
    Vector3D horizontal() const { return Vector3D(m_x, 0.0f, m_z); }

    bool isZero() const { return m_x == 0.0f && m_y == 0.0f && m_z == 0.0f; }

    Vector3D operator+(const Vector3D& v2) const {
        return Vector3D(m_x + v2.m_x, m_y + v2.m_y, m_z + v2.m_z);
    }

    Vector3D& operator+=(const Vector3D& v2) {
        m_x += v2.m_x;
        m_y += v2.m_y;
        m_z += v2.m_z;
        return *this;
    }

    Vector3D operator-(const Vector3D& v2) const {
        return Vector3D(m_x - v2.m_x, m_y - v2.m_y, m_z - v2.m_z);
    }

    Vector3D& operator-=(const Vector3D& v2) {
        m_x -= v2.m_x;
        m_y -= v2.m_y;
        m_z -= v2.m_z;
        return *this;
    }

    Vector3D operator-() const { return Vector3D(-m_x, -m_y, -m_z); }

    Vector3D operator*(float scalar) const {
        return Vector3D(m_x * scalar, m_y * scalar, m_z * scalar);
    }

    Vector3D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        m_z *= scalar;
        return *this;
    }

    Vector3D operator/(float scalar) const {
        return Vector3D(m_x / scalar, m_y / scalar, m_z / scalar);
    }

    // Exact component equality
    bool operator==(const Vector3D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y && m_z == v2.m_z;
    }
    bool operator!=(const Vector3D& v2) const { return !(*this == v2); }

    static float distanceSquared(const Vector3D& a, const Vector3D& b) {
        return (a - b).lengthSquared();
    }

    static float horizontalDistance(const Vector3D& a, const Vector3D& b) {
        float dx = a.m_x - b.m_x;
        float dz = a.m_z - b.m_z;
        return std::sqrt(dx * dx + dz * dz);
    }

    friend std::ostream& operator<<(std::ostream& os, const Vector3D& v) {
        return os << "(" << v.m_x << ", " << v.m_y << ", " << v.m_z << ")";
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
    float m_z{0.0f};
};

} // namespace Ironclad

#endif // VECTOR_3D_HPP
