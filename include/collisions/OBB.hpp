/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OBB_HPP
#define OBB_HPP

#include "utils/Quaternion.hpp"
#include "utils/Vector3D.hpp"

#include <cmath>
#include <variant>

namespace Ironclad {

// Oriented box rotating about the vertical axis. Half extents are >= 0.
struct OBB {
    Vector3D center;
    Vector3D halfSize;
    Quaternion rotation;

    OBB() = default;
    OBB(const Vector3D& c, const Vector3D& half, const Quaternion& rot)
        : center(c),
          halfSize(std::fabs(half.getX()), std::fabs(half.getY()), std::fabs(half.getZ())),
          rotation(rot) {}
};

// Bounds of a body that never moves; no update operation by construction.
class StaticBounds {
public:
    explicit StaticBounds(const OBB& obb) : m_obb(obb) {}

    const OBB& getOBB() const { return m_obb; }

private:
    OBB m_obb;
};

// Bounds that follow an owner's planned pose. The local center offset is
// added unrotated, matching how hitboxes are authored on the vehicle root.
class DynamicBounds {
public:
    DynamicBounds(const Vector3D& localCenter, const Vector3D& halfSize)
        : m_localCenter(localCenter), m_obb(localCenter, halfSize, Quaternion::identity()) {}

    void update(const Vector3D& plannedPosition, const Quaternion& plannedRotation) {
        m_obb.center = plannedPosition + m_localCenter;
        m_obb.rotation = plannedRotation;
    }

    const OBB& getOBB() const { return m_obb; }
    const Vector3D& getLocalCenter() const { return m_localCenter; }

private:
    Vector3D m_localCenter;
    OBB m_obb;
};

using Bounds = std::variant<StaticBounds, DynamicBounds>;

namespace OBBFactory {

/**
 * @brief Bounds for a fixed collider from a transform snapshot
 * @param position World position of the collider root
 * @param rotation World rotation of the collider root
 * @param localCenter Collider center in root-local space (rotated into world)
 * @param size Full collider size; negative components are mirrored
 */
inline StaticBounds createStatic(const Vector3D& position, const Quaternion& rotation,
                                 const Vector3D& localCenter, const Vector3D& size) {
    return StaticBounds(OBB(position + rotation.rotate(localCenter), size * 0.5f, rotation));
}

/**
 * @brief Bounds for a moving collider
 * @param localCenter Offset from the owner's planned position
 * @param size Full collider size
 */
inline DynamicBounds createDynamic(const Vector3D& localCenter, const Vector3D& size) {
    return DynamicBounds(localCenter, size * 0.5f);
}

} // namespace OBBFactory

} // namespace Ironclad

#endif // OBB_HPP
