/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESOLVE_INFO_HPP
#define COLLISION_RESOLVE_INFO_HPP

#include "utils/Vector3D.hpp"

namespace Ironclad {

// Push-out to add to a body's planned position. A zero vector means "no push".
class CollisionResolveInfo {
public:
    CollisionResolveInfo() = default;
    explicit CollisionResolveInfo(const Vector3D& resolveVector) : m_resolveVector(resolveVector) {}

    const Vector3D& getResolveVector() const { return m_resolveVector; }
    Vector3D getDirection() const { return m_resolveVector.normalized(); }
    float getDistance() const { return m_resolveVector.length(); }
    bool isValid() const { return m_resolveVector.lengthSquared() > 0.0f; }

private:
    Vector3D m_resolveVector;
};

} // namespace Ironclad

#endif // COLLISION_RESOLVE_INFO_HPP
