/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Item.hpp"

#include <algorithm>

namespace Ironclad {

const char* toString(ItemType type) {
    switch (type) {
    case ItemType::Repair: return "Repair";
    case ItemType::Ammo: return "Ammo";
    case ItemType::SpeedBoost: return "SpeedBoost";
    }
    return "Unknown";
}

Item::Item(ItemType type, const Vector3D& position, float yawRadians,
           const Vector3D& size, float pickupDelay)
    : m_id(nextEntityID()),
      m_type(type),
      m_position(position),
      m_rotation(Quaternion::fromYaw(yawRadians)),
      m_size(size),
      m_pickupTimer(std::max(0.0f, pickupDelay)) {}

void Item::update(float deltaTime) {
    if (m_pickupTimer > 0.0f) {
        m_pickupTimer = std::max(0.0f, m_pickupTimer - deltaTime);
    }
}

} // namespace Ironclad
