/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/StageBoundary.hpp"
#include "core/Logger.hpp"

#include <format>
#include <string>

namespace Ironclad {

StageBoundary::StageBoundary(float radius, const Vector3D& center)
    : m_radius(radius), m_center(center) {
    if (m_radius < 0.0f) {
        ARENA_WARN(std::format("Negative stage radius {}, boundary disabled", radius));
        m_radius = 0.0f;
    }
}

bool StageBoundary::contains(const Vector3D& position) const {
    return !isEnabled() || Vector3D::horizontalDistance(position, m_center) <= m_radius;
}

Vector3D StageBoundary::clamp(const Vector3D& position) const {
    if (!isEnabled()) {
        return position;
    }

    const Vector3D offset = (position - m_center).horizontal();
    const float distance = offset.length();
    if (distance <= m_radius) {
        return position;
    }

    const Vector3D edge = m_center + offset * (m_radius / distance);
    return Vector3D(edge.getX(), position.getY(), edge.getZ());
}

} // namespace Ironclad
