/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionContext.hpp"

namespace Ironclad {

const char* toString(CollisionKind kind) {
    switch (kind) {
    case CollisionKind::Tank: return "Tank";
    case CollisionKind::Obstacle: return "Obstacle";
    case CollisionKind::Item: return "Item";
    case CollisionKind::Bullet: return "Bullet";
    }
    return "Unknown";
}

CollisionContext::CollisionContext(EntityID id, CollisionKind kind, const ICollisionOwner& owner, Bounds bounds)
    : m_entityId(id), m_kind(kind), m_owner(&owner), m_bounds(std::move(bounds)) {
    if (isStatic()) {
        m_committedLock = MovementLockAxis::All;
    } else {
        updateOBB();
    }
}

const OBB& CollisionContext::getOBB() const {
    if (const auto* fixed = std::get_if<StaticBounds>(&m_bounds)) {
        return fixed->getOBB();
    }
    return std::get<DynamicBounds>(m_bounds).getOBB();
}

void CollisionContext::updateOBB() {
    if (auto* dynamic = std::get_if<DynamicBounds>(&m_bounds)) {
        dynamic->update(m_owner->getPlannedNextPosition(), m_owner->getPlannedNextRotation());
    }
}

void CollisionContext::beginFrame() {
    m_pendingLock = MovementLockAxis::None;
    m_resolvedThisFrame = false;
}

void CollisionContext::addPendingLockAxis(MovementLockAxis axis) {
    if (isStatic() || axis == MovementLockAxis::None) {
        return;
    }
    m_pendingLock |= axis;
    m_resolvedThisFrame = true;
}

void CollisionContext::finalizeLockAxis() {
    if (isStatic()) {
        return;
    }
    // X|Z is the same bit pattern as All
    m_committedLock = m_pendingLock;
    m_resolvedThisFrame = false;
}

MovementLockAxis CollisionContext::getLockAxis() const {
    return isStatic() ? MovementLockAxis::All : m_committedLock;
}

} // namespace Ironclad
