/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_CONTEXT_HPP
#define COLLISION_CONTEXT_HPP

#include "collisions/ICollisionOwner.hpp"
#include "collisions/MovementLockAxis.hpp"
#include "collisions/OBB.hpp"
#include "entities/EntityID.hpp"

#include <cstdint>

namespace Ironclad {

enum class CollisionKind : uint8_t {
    Tank,
    Obstacle,
    Item,
    Bullet
};

const char* toString(CollisionKind kind);

/**
 * @brief Binds one entity to its bounds and per-frame lock state
 *
 * Lock state is double-buffered. Pair resolution only reads the committed
 * mask (last frame's result) while writing the pending mask; the manager
 * calls finalizeLockAxis() once after every pair has been processed so the
 * outcome never depends on pair order. Static contexts are always fully
 * locked and ignore all lock updates.
 */
class CollisionContext {
public:
    CollisionContext(EntityID id, CollisionKind kind, const ICollisionOwner& owner, Bounds bounds);

    EntityID getEntityID() const { return m_entityId; }
    CollisionKind getKind() const { return m_kind; }
    const ICollisionOwner& getOwner() const { return *m_owner; }

    const OBB& getOBB() const;
    bool isStatic() const { return std::holds_alternative<StaticBounds>(m_bounds); }

    // Refresh dynamic bounds from the owner's planned pose
    void updateOBB();

    void beginFrame();
    void addPendingLockAxis(MovementLockAxis axis);
    void finalizeLockAxis();

    MovementLockAxis getLockAxis() const;
    MovementLockAxis getPendingLockAxis() const { return m_pendingLock; }
    bool wasResolvedThisFrame() const { return m_resolvedThisFrame; }

private:
    EntityID m_entityId{INVALID_ENTITY_ID};
    CollisionKind m_kind;
    const ICollisionOwner* m_owner;
    Bounds m_bounds;

    MovementLockAxis m_pendingLock{MovementLockAxis::None};
    MovementLockAxis m_committedLock{MovementLockAxis::None};
    bool m_resolvedThisFrame{false};
};

} // namespace Ironclad

#endif // COLLISION_CONTEXT_HPP
