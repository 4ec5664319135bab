/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STAGE_BOUNDARY_HPP
#define STAGE_BOUNDARY_HPP

#include "utils/Vector3D.hpp"

namespace Ironclad {

/**
 * @brief Circular arena limit on the horizontal plane
 *
 * A radius of 0 disables the boundary. Height is never changed.
 */
class StageBoundary {
public:
    explicit StageBoundary(float radius = 0.0f, const Vector3D& center = Vector3D());

    bool isEnabled() const { return m_radius > 0.0f; }
    float getRadius() const { return m_radius; }
    const Vector3D& getCenter() const { return m_center; }

    bool contains(const Vector3D& position) const;

    // Nearest point to position that lies inside the arena
    Vector3D clamp(const Vector3D& position) const;

private:
    float m_radius;
    Vector3D m_center;
};

} // namespace Ironclad

#endif // STAGE_BOUNDARY_HPP
