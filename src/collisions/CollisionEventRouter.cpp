/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionEventRouter.hpp"
#include "collisions/CollisionResolveCalculator.hpp"
#include "core/Logger.hpp"
#include "entities/Bullet.hpp"
#include "entities/Item.hpp"
#include "entities/Obstacle.hpp"
#include "entities/Tank.hpp"

#include <format>
#include <iterator>
#include <limits>
#include <string>
#include <type_traits>

namespace Ironclad {

namespace {

constexpr EntityID kLastId = std::numeric_limits<EntityID>::max();

MovementLockAxis blockedAxes(const Vector3D& push) {
    MovementLockAxis lock = MovementLockAxis::None;
    if (push.getX() != 0.0f) {
        lock |= MovementLockAxis::X;
    }
    if (push.getZ() != 0.0f) {
        lock |= MovementLockAxis::Z;
    }
    return lock;
}

} // anonymous namespace

CollisionEventRouter::CollisionEventRouter(const CollisionResolveCalculator& resolver)
    : m_resolver(resolver) {}

void CollisionEventRouter::clearCallbacks() {
    m_bulletHitCallbacks.clear();
    m_despawnCallbacks.clear();
    m_itemPickupCallbacks.clear();
}

// ----------------------------------------------------------------------------
// Tanks
// ----------------------------------------------------------------------------

void CollisionEventRouter::handleTankHitObstacle(Tank& tank, CollisionContext& tankContext,
                                                 CollisionContext& obstacleContext) {
    CollisionResolveInfo resolveTank;
    CollisionResolveInfo resolveObstacle;
    if (!m_resolver.calculateResolveInfo(tankContext, obstacleContext,
                                         tankContext.getOwner().getForwardSpeed(), 0.0f, true,
                                         resolveTank, resolveObstacle)) {
        return;
    }

    tankContext.addPendingLockAxis(blockedAxes(resolveTank.getResolveVector()));
    tank.applyCollisionResolve(resolveTank);
    tankContext.updateOBB();

    COLLISION_DEBUG(std::format("Tank {} pushed out of obstacle {} by {:.4f}",
                                tankContext.getEntityID(), obstacleContext.getEntityID(),
                                resolveTank.getDistance()));
}

void CollisionEventRouter::handleTankHitTank(Tank& tankA, CollisionContext& contextA,
                                             Tank& tankB, CollisionContext& contextB) {
    if (tankA.isBroken() && tankB.isBroken()) {
        return;
    }

    // A wreck does not move, so the live tank takes the whole push
    if (tankA.isBroken() || tankB.isBroken()) {
        Tank& mover = tankA.isBroken() ? tankB : tankA;
        CollisionContext& moverContext = tankA.isBroken() ? contextB : contextA;
        CollisionContext& wreckContext = tankA.isBroken() ? contextA : contextB;

        CollisionResolveInfo resolveMover;
        CollisionResolveInfo resolveWreck;
        if (m_resolver.calculateResolveInfo(moverContext, wreckContext,
                                            moverContext.getOwner().getForwardSpeed(), 0.0f, true,
                                            resolveMover, resolveWreck)) {
            mover.applyCollisionResolve(resolveMover);
            moverContext.updateOBB();
        }
        return;
    }

    CollisionResolveInfo resolveA;
    CollisionResolveInfo resolveB;
    if (!m_resolver.calculateResolveInfo(contextA, contextB,
                                         contextA.getOwner().getForwardSpeed(),
                                         contextB.getOwner().getForwardSpeed(), false,
                                         resolveA, resolveB)) {
        return;
    }

    tankA.applyCollisionResolve(resolveA);
    tankB.applyCollisionResolve(resolveB);
    contextA.updateOBB();
    contextB.updateOBB();
}

void CollisionEventRouter::handleTankHitItem(const CollisionContext& tankContext, const Item& item) {
    if (!item.canPickup()) {
        return;
    }

    const ItemPickupInfo info{tankContext.getEntityID(), item.getID()};
    for (const auto& cb : m_itemPickupCallbacks) {
        cb(info);
    }
}

// ----------------------------------------------------------------------------
// Bullets
// ----------------------------------------------------------------------------

void CollisionEventRouter::handleBulletHitObstacle(const Bullet& bullet, const CollisionContext& bulletContext,
                                                   const Obstacle& obstacle) {
    if (obstacle.isBase()) {
        return;
    }
    dispatchBulletHit(bullet, bulletContext, obstacle.getID(), CollisionKind::Obstacle);
}

void CollisionEventRouter::handleBulletHitTank(const Bullet& bullet, const CollisionContext& bulletContext,
                                               const CollisionContext& tankContext) {
    if (tankContext.getEntityID() == bullet.getShooterID()) {
        return;
    }
    dispatchBulletHit(bullet, bulletContext, tankContext.getEntityID(), CollisionKind::Tank);
}

void CollisionEventRouter::dispatchBulletHit(const Bullet& bullet, const CollisionContext& bulletContext,
                                             EntityID targetId, CollisionKind targetKind) {
    const EntityID bulletId = bullet.getID();
    if (isSpent(bulletId) || !recordHit(bulletId, targetId)) {
        return;
    }

    const Vector3D impactPoint = bulletContext.getOBB().center;
    emitHit(bullet, impactPoint, targetId, targetKind, false);

    std::visit([&](const auto& kind) {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, ExplosiveBullet>) {
            detonate(bullet, impactPoint, kind.blastRadius);
            despawn(bulletId);
        } else if constexpr (std::is_same_v<T, PenetrationBullet>) {
            if (targetKind == CollisionKind::Obstacle || getHitCount(bulletId) >= kind.maxTargets) {
                despawn(bulletId);
            }
        } else if constexpr (std::is_same_v<T, HomingBullet>) {
            despawn(bulletId);
        }
    }, bullet.getKind());
}

void CollisionEventRouter::detonate(const Bullet& bullet, const Vector3D& center, float blastRadius) {
    if (!m_areaQuery || blastRadius <= 0.0f) {
        return;
    }

    m_areaBuffer.clear();
    m_areaQuery(center, blastRadius, m_areaBuffer);

    for (const CollisionContext* context : m_areaBuffer) {
        const EntityID targetId = context->getEntityID();
        if (targetId == bullet.getShooterID()) {
            continue;
        }
        if (recordHit(bullet.getID(), targetId)) {
            emitHit(bullet, center, targetId, context->getKind(), true);
        }
    }
}

void CollisionEventRouter::emitHit(const Bullet& bullet, const Vector3D& impactPoint, EntityID targetId,
                                   CollisionKind targetKind, bool areaDamage) {
    BulletHitInfo info;
    info.bulletId = bullet.getID();
    info.shooterId = bullet.getShooterID();
    info.targetId = targetId;
    info.targetKind = targetKind;
    info.damage = bullet.getDamage();
    info.areaDamage = areaDamage;
    info.impactPoint = impactPoint;

    for (const auto& cb : m_bulletHitCallbacks) {
        cb(info);
    }
}

void CollisionEventRouter::despawn(EntityID bulletId) {
    if (!m_spentBullets.insert(bulletId).second) {
        return;
    }
    for (const auto& cb : m_despawnCallbacks) {
        cb(bulletId);
    }
}

// ----------------------------------------------------------------------------
// Hit history
// ----------------------------------------------------------------------------

bool CollisionEventRouter::recordHit(EntityID bulletId, EntityID targetId) {
    return m_hitHistory.emplace(bulletId, targetId).second;
}

bool CollisionEventRouter::hasHit(EntityID bulletId, EntityID targetId) const {
    return m_hitHistory.count({bulletId, targetId}) > 0;
}

size_t CollisionEventRouter::getHitCount(EntityID bulletId) const {
    auto first = m_hitHistory.lower_bound({bulletId, 0});
    auto last = m_hitHistory.upper_bound({bulletId, kLastId});
    return static_cast<size_t>(std::distance(first, last));
}

void CollisionEventRouter::clearHitHistory(EntityID bulletId) {
    m_hitHistory.erase(m_hitHistory.lower_bound({bulletId, 0}),
                       m_hitHistory.upper_bound({bulletId, kLastId}));
    m_spentBullets.erase(bulletId);
}

void CollisionEventRouter::clearAllHitHistory() {
    m_hitHistory.clear();
    m_spentBullets.clear();
}

} // namespace Ironclad
