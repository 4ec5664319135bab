/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_EVENT_ROUTER_HPP
#define COLLISION_EVENT_ROUTER_HPP

#include "collisions/CollisionContext.hpp"
#include "entities/EntityID.hpp"
#include "utils/Vector3D.hpp"

#include <functional>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Ironclad {

class Bullet;
class CollisionResolveCalculator;
class Item;
class Obstacle;
class Tank;

struct BulletHitInfo {
    EntityID bulletId{INVALID_ENTITY_ID};
    EntityID shooterId{INVALID_ENTITY_ID};
    EntityID targetId{INVALID_ENTITY_ID};
    CollisionKind targetKind{CollisionKind::Tank};
    float damage{0.0f};
    bool areaDamage{false};   // caught in a blast rather than struck directly
    Vector3D impactPoint;     // bullet center at the time of the hit
};

struct ItemPickupInfo {
    EntityID tankId{INVALID_ENTITY_ID};
    EntityID itemId{INVALID_ENTITY_ID};
};

using BulletHitCB = std::function<void(const BulletHitInfo&)>;
using BulletDespawnCB = std::function<void(EntityID bulletId)>;
using ItemPickupCB = std::function<void(const ItemPickupInfo&)>;

// Fills out with every tank/obstacle context overlapping the circle
using AreaQueryFn = std::function<void(const Vector3D& center, float radius,
                                       std::vector<const CollisionContext*>& out)>;

/**
 * @brief Turns confirmed overlaps into gameplay effects
 *
 * Tank pairs are resolved and pushed apart; everything else becomes a
 * callback. Each (bullet, target) pair is reported at most once until the
 * bullet's history is cleared when it returns to its pool.
 */
class CollisionEventRouter {
public:
    explicit CollisionEventRouter(const CollisionResolveCalculator& resolver);

    void setAreaQuery(AreaQueryFn query) { m_areaQuery = std::move(query); }

    void addBulletHitCallback(BulletHitCB cb) { m_bulletHitCallbacks.push_back(std::move(cb)); }
    void addBulletDespawnCallback(BulletDespawnCB cb) { m_despawnCallbacks.push_back(std::move(cb)); }
    void addItemPickupCallback(ItemPickupCB cb) { m_itemPickupCallbacks.push_back(std::move(cb)); }
    void clearCallbacks();

    // Pushes the tank out of the obstacle and records the blocked axes as pending locks
    void handleTankHitObstacle(Tank& tank, CollisionContext& tankContext,
                               CollisionContext& obstacleContext);

    // Splits the push by speed; a broken tank is treated as immovable
    void handleTankHitTank(Tank& tankA, CollisionContext& contextA,
                           Tank& tankB, CollisionContext& contextB);

    void handleTankHitItem(const CollisionContext& tankContext, const Item& item);

    void handleBulletHitObstacle(const Bullet& bullet, const CollisionContext& bulletContext,
                                 const Obstacle& obstacle);

    void handleBulletHitTank(const Bullet& bullet, const CollisionContext& bulletContext,
                             const CollisionContext& tankContext);

    void clearHitHistory(EntityID bulletId);
    void clearAllHitHistory();

    bool hasHit(EntityID bulletId, EntityID targetId) const;
    size_t getHitCount(EntityID bulletId) const;
    bool isSpent(EntityID bulletId) const { return m_spentBullets.count(bulletId) > 0; }

private:
    const CollisionResolveCalculator& m_resolver;
    AreaQueryFn m_areaQuery;

    std::vector<BulletHitCB> m_bulletHitCallbacks;
    std::vector<BulletDespawnCB> m_despawnCallbacks;
    std::vector<ItemPickupCB> m_itemPickupCallbacks;

    // Ordered so one bullet's entries form a contiguous range
    std::set<std::pair<EntityID, EntityID>> m_hitHistory;
    std::unordered_set<EntityID> m_spentBullets;

    std::vector<const CollisionContext*> m_areaBuffer;

    void dispatchBulletHit(const Bullet& bullet, const CollisionContext& bulletContext,
                           EntityID targetId, CollisionKind targetKind);
    bool recordHit(EntityID bulletId, EntityID targetId);
    void emitHit(const Bullet& bullet, const Vector3D& impactPoint, EntityID targetId,
                 CollisionKind targetKind, bool areaDamage);
    void detonate(const Bullet& bullet, const Vector3D& center, float blastRadius);
    void despawn(EntityID bulletId);
};

} // namespace Ironclad

#endif // COLLISION_EVENT_ROUTER_HPP
