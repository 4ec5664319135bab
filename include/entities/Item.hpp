/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ITEM_HPP
#define ITEM_HPP

#include "collisions/ICollisionOwner.hpp"
#include "entities/EntityID.hpp"
#include "utils/Quaternion.hpp"
#include "utils/Vector3D.hpp"

#include <cstdint>

namespace Ironclad {

enum class ItemType : uint8_t {
    Repair,
    Ammo,
    SpeedBoost
};

const char* toString(ItemType type);

/**
 * @brief Pickup lying in the arena
 *
 * A freshly dropped item cannot be collected until its pickup delay has
 * elapsed, so a tank driving over its own drop does not grab it instantly.
 */
class Item : public ICollisionOwner {
public:
    Item(ItemType type, const Vector3D& position, float yawRadians,
         const Vector3D& size, float pickupDelay = 0.0f);
    ~Item() override = default;

    EntityID getID() const { return m_id; }
    ItemType getType() const { return m_type; }
    const Vector3D& getPosition() const { return m_position; }
    const Quaternion& getRotation() const { return m_rotation; }
    const Vector3D& getSize() const { return m_size; }

    void update(float deltaTime);
    bool canPickup() const { return m_pickupTimer <= 0.0f; }

    Vector3D getPlannedNextPosition() const override { return m_position; }
    Quaternion getPlannedNextRotation() const override { return m_rotation; }
    float getForwardSpeed() const override { return 0.0f; }

private:
    EntityID m_id;
    ItemType m_type;
    Vector3D m_position;
    Quaternion m_rotation;
    Vector3D m_size;
    float m_pickupTimer;
};

} // namespace Ironclad

#endif // ITEM_HPP
