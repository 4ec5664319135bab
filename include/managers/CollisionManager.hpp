/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_MANAGER_HPP
#define COLLISION_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "collisions/CollisionConfig.hpp"
#include "collisions/CollisionContext.hpp"
#include "collisions/CollisionEventRouter.hpp"
#include "collisions/CollisionResolveCalculator.hpp"
#include "collisions/MovementLockAxis.hpp"
#include "entities/EntityID.hpp"

namespace Ironclad {

class Bullet;
class Item;
class Obstacle;
class Tank;

/**
 * @brief Owns every collision context and runs the per-frame collision pass
 *
 * Frame order (see update()):
 *   1. tank lock state reset, dynamic bounds refreshed from planned poses
 *   2. tank x obstacle  (push-out + pending lock axes)
 *   3. tank x tank      (push-out split by forward speed)
 *   4. tank x item      (pickup callbacks)
 *   5. bullet x obstacle, bullet x tank (hit callbacks)
 *   6. tank lock axes committed
 * Pairs are brute-forced in registration order. Entities are not owned and
 * must outlive their registration.
 */
class CollisionManager {
public:
    static CollisionManager& Instance() {
        static CollisionManager s_instance;
        return s_instance;
    }

    bool init(const CollisionConfig& config = CollisionConfig{});
    void clean();
    bool isInitialized() const { return m_initialized; }

    /**
     * @brief Runs one collision pass over the planned poses of all entities
     *
     * Callers plan movement before and commit it after. Registration calls
     * made from callbacks during the pass are applied when it finishes.
     */
    void update();

    // Registration. Duplicate ids and unknown ids return false.
    bool registerTank(Tank& tank);
    bool registerObstacle(const Obstacle& obstacle);
    bool registerItem(const Item& item);
    bool registerBullet(const Bullet& bullet);

    bool unregisterTank(EntityID id);
    bool unregisterObstacle(EntityID id);
    bool unregisterItem(EntityID id);
    // Also forgets which targets the bullet already hit
    bool unregisterBullet(EntityID id);

    // Applies registrations queued while a pass was running
    void processPendingCommands();

    // Committed lock mask from the last pass, None for unknown ids
    MovementLockAxis getLockAxis(EntityID tankId) const;

    const CollisionContext* getContext(EntityID id) const;

    // Narrow-phase test on current bounds, false if either id is unknown
    bool overlaps(EntityID a, EntityID b) const;

    /**
     * @brief Tanks and non-base obstacles whose bounds overlap a circle
     *
     * Used for area damage. out is cleared first; results are ordered tanks
     * first, then obstacles, each in registration order.
     */
    void queryCircleHorizontal(const Vector3D& center, float radius, std::vector<EntityID>& out) const;
    void queryCircleHorizontal(const Vector3D& center, float radius,
                               std::vector<const CollisionContext*>& out) const;

    CollisionEventRouter& getEventRouter() { return *m_router; }
    const CollisionConfig& getConfig() const { return m_config; }

    size_t getTankCount() const { return m_tanks.size(); }
    size_t getObstacleCount() const { return m_obstacles.size(); }
    size_t getItemCount() const { return m_items.size(); }
    size_t getBulletCount() const { return m_bullets.size(); }
    uint64_t getFrameCount() const { return m_frameCount; }

    void logCollisionStatistics() const;

    ~CollisionManager() { if (m_initialized) clean(); }

private:
    template<typename TEntity>
    struct Slot {
        TEntity* entity;
        CollisionContext context;
    };

    // Obstacles, items and bullets are only read; tanks get pushed
    std::vector<Slot<Tank>> m_tanks;
    std::vector<Slot<const Obstacle>> m_obstacles;
    std::vector<Slot<const Item>> m_items;
    std::vector<Slot<const Bullet>> m_bullets;

    CollisionConfig m_config;
    CollisionResolveCalculator m_resolver;
    std::unique_ptr<CollisionEventRouter> m_router;

    std::vector<std::function<bool()>> m_pendingCommands;
    mutable std::vector<const OBB*> m_queryHits;
    bool m_inCollisionPass{false};
    bool m_initialized{false};
    uint64_t m_frameCount{0};

    // Per-frame statistics
    size_t m_lastPairTests{0};
    size_t m_lastContacts{0};

    bool isRegistered(EntityID id) const;
    bool deferIfBusy(std::function<bool()> command);

    void runTankObstaclePass();
    void runTankTankPass();
    void runTankItemPass();
    void runBulletPasses();

    CollisionManager();
    CollisionManager(const CollisionManager&) = delete;
    CollisionManager& operator=(const CollisionManager&) = delete;
};

} // namespace Ironclad

#endif // COLLISION_MANAGER_HPP
