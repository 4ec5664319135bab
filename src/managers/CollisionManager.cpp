/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CollisionManager.hpp"
#include "collisions/OBB.hpp"
#include "collisions/SATCollisionCalculator.hpp"
#include "core/Logger.hpp"
#include "entities/Bullet.hpp"
#include "entities/Item.hpp"
#include "entities/Obstacle.hpp"
#include "entities/Tank.hpp"

#include <boost/container/small_vector.hpp>

#include <algorithm>
#include <format>
#include <span>
#include <string>

namespace Ironclad {

namespace {

template<typename TSlot>
auto findSlot(std::vector<TSlot>& slots, EntityID id) {
    return std::find_if(slots.begin(), slots.end(),
                        [id](const TSlot& slot) { return slot.context.getEntityID() == id; });
}

template<typename TSlot>
const CollisionContext* findContext(const std::vector<TSlot>& slots, EntityID id) {
    auto it = std::find_if(slots.begin(), slots.end(),
                           [id](const TSlot& slot) { return slot.context.getEntityID() == id; });
    return it == slots.end() ? nullptr : &it->context;
}

template<typename TSlot>
bool eraseSlot(std::vector<TSlot>& slots, EntityID id, const char* kind) {
    auto it = findSlot(slots, id);
    if (it == slots.end()) {
        COLLISION_WARN(std::format("Cannot unregister unknown {} {}", kind, id));
        return false;
    }
    // erase keeps registration order, which fixes pair order
    slots.erase(it);
    COLLISION_DEBUG(std::format("Unregistered {} {}", kind, id));
    return true;
}

} // anonymous namespace

CollisionManager::CollisionManager()
    : m_resolver(m_config),
      m_router(std::make_unique<CollisionEventRouter>(m_resolver)) {}

bool CollisionManager::init(const CollisionConfig& config) {
    if (m_initialized) {
        COLLISION_WARN("CollisionManager already initialized");
        return true;
    }

    m_config = config;
    m_resolver = CollisionResolveCalculator(m_config);

    const size_t capacity = static_cast<size_t>(std::max(0, m_config.overlapCapacity));
    m_tanks.reserve(capacity);
    m_obstacles.reserve(capacity);
    m_items.reserve(capacity);
    m_bullets.reserve(capacity);
    m_queryHits.reserve(capacity);

    m_router->setAreaQuery([this](const Vector3D& center, float radius,
                                  std::vector<const CollisionContext*>& out) {
        queryCircleHorizontal(center, radius, out);
    });

    m_frameCount = 0;
    m_initialized = true;
    COLLISION_INFO(std::format("CollisionManager initialized (min resolve distance {}, stage radius {})",
                               m_config.minResolveDistance, m_config.stageRadius));
    return true;
}

void CollisionManager::clean() {
    m_tanks.clear();
    m_obstacles.clear();
    m_items.clear();
    m_bullets.clear();
    m_pendingCommands.clear();
    m_queryHits.clear();

    m_router->clearCallbacks();
    m_router->clearAllHitHistory();
    m_router->setAreaQuery(nullptr);

    m_inCollisionPass = false;
    m_frameCount = 0;
    m_lastPairTests = 0;
    m_lastContacts = 0;
    m_initialized = false;
    COLLISION_INFO("CollisionManager cleaned");
}

// ============================================================================
// Registration
// ============================================================================

bool CollisionManager::isRegistered(EntityID id) const {
    return getContext(id) != nullptr;
}

bool CollisionManager::deferIfBusy(std::function<bool()> command) {
    if (!m_inCollisionPass) {
        return false;
    }
    m_pendingCommands.push_back(std::move(command));
    return true;
}

void CollisionManager::processPendingCommands() {
    if (m_inCollisionPass || m_pendingCommands.empty()) {
        return;
    }

    std::vector<std::function<bool()>> commands;
    commands.swap(m_pendingCommands);

    size_t failed = 0;
    for (auto& command : commands) {
        if (!command()) {
            ++failed;
        }
    }
    if (failed > 0) {
        COLLISION_WARN(std::format("{} of {} deferred registration commands failed",
                                   failed, commands.size()));
    }
}

bool CollisionManager::registerTank(Tank& tank) {
    if (deferIfBusy([this, &tank]() { return registerTank(tank); })) {
        return true;
    }
    if (isRegistered(tank.getID())) {
        COLLISION_WARN(std::format("Tank {} already registered", tank.getID()));
        return false;
    }

    m_tanks.push_back(Slot<Tank>{
        &tank,
        CollisionContext(tank.getID(), CollisionKind::Tank, tank,
                         OBBFactory::createDynamic(tank.getHitboxCenter(), tank.getHitboxSize()))});
    COLLISION_DEBUG(std::format("Registered tank {}", tank.getID()));
    return true;
}

bool CollisionManager::registerObstacle(const Obstacle& obstacle) {
    if (deferIfBusy([this, &obstacle]() { return registerObstacle(obstacle); })) {
        return true;
    }
    if (isRegistered(obstacle.getID())) {
        COLLISION_WARN(std::format("Obstacle {} already registered", obstacle.getID()));
        return false;
    }

    m_obstacles.push_back(Slot<const Obstacle>{
        &obstacle,
        CollisionContext(obstacle.getID(), CollisionKind::Obstacle, obstacle,
                         OBBFactory::createStatic(obstacle.getPosition(), obstacle.getRotation(),
                                                  obstacle.getLocalCenter(), obstacle.getSize()))});
    COLLISION_DEBUG(std::format("Registered obstacle {}", obstacle.getID()));
    return true;
}

bool CollisionManager::registerItem(const Item& item) {
    if (deferIfBusy([this, &item]() { return registerItem(item); })) {
        return true;
    }
    if (isRegistered(item.getID())) {
        COLLISION_WARN(std::format("Item {} already registered", item.getID()));
        return false;
    }

    m_items.push_back(Slot<const Item>{
        &item,
        CollisionContext(item.getID(), CollisionKind::Item, item,
                         OBBFactory::createStatic(item.getPosition(), item.getRotation(),
                                                  Vector3D(), item.getSize()))});
    COLLISION_DEBUG(std::format("Registered item {}", item.getID()));
    return true;
}

bool CollisionManager::registerBullet(const Bullet& bullet) {
    if (deferIfBusy([this, &bullet]() { return registerBullet(bullet); })) {
        return true;
    }
    if (isRegistered(bullet.getID())) {
        COLLISION_WARN(std::format("Bullet {} already registered", bullet.getID()));
        return false;
    }

    m_bullets.push_back(Slot<const Bullet>{
        &bullet,
        CollisionContext(bullet.getID(), CollisionKind::Bullet, bullet,
                         OBBFactory::createDynamic(Vector3D(), bullet.getSize()))});
    return true;
}

bool CollisionManager::unregisterTank(EntityID id) {
    if (deferIfBusy([this, id]() { return unregisterTank(id); })) {
        return true;
    }
    return eraseSlot(m_tanks, id, "tank");
}

bool CollisionManager::unregisterObstacle(EntityID id) {
    if (deferIfBusy([this, id]() { return unregisterObstacle(id); })) {
        return true;
    }
    return eraseSlot(m_obstacles, id, "obstacle");
}

bool CollisionManager::unregisterItem(EntityID id) {
    if (deferIfBusy([this, id]() { return unregisterItem(id); })) {
        return true;
    }
    return eraseSlot(m_items, id, "item");
}

bool CollisionManager::unregisterBullet(EntityID id) {
    if (deferIfBusy([this, id]() { return unregisterBullet(id); })) {
        return true;
    }
    // A pooled bullet may come back with the same id, so it must forget its targets
    m_router->clearHitHistory(id);
    return eraseSlot(m_bullets, id, "bullet");
}

// ============================================================================
// Frame pass
// ============================================================================

void CollisionManager::update() {
    if (!m_initialized) {
        COLLISION_ERROR("update() called before init()");
        return;
    }

    m_inCollisionPass = true;
    m_lastPairTests = 0;
    m_lastContacts = 0;

    for (auto& slot : m_tanks) {
        slot.context.beginFrame();
        slot.context.updateOBB();
    }
    for (auto& slot : m_bullets) {
        slot.context.updateOBB();
    }

    runTankObstaclePass();
    runTankTankPass();
    runTankItemPass();
    runBulletPasses();

    for (auto& slot : m_tanks) {
        slot.context.finalizeLockAxis();
    }

    m_inCollisionPass = false;
    ++m_frameCount;
    processPendingCommands();
}

void CollisionManager::runTankObstaclePass() {
    for (auto& tankSlot : m_tanks) {
        for (auto& obstacleSlot : m_obstacles) {
            ++m_lastPairTests;
            if (!SATCollisionCalculator::isCollidingHorizontal(tankSlot.context.getOBB(),
                                                               obstacleSlot.context.getOBB())) {
                continue;
            }
            ++m_lastContacts;
            m_router->handleTankHitObstacle(*tankSlot.entity, tankSlot.context, obstacleSlot.context);
        }
    }
}

void CollisionManager::runTankTankPass() {
    for (size_t i = 0; i < m_tanks.size(); ++i) {
        for (size_t j = i + 1; j < m_tanks.size(); ++j) {
            auto& a = m_tanks[i];
            auto& b = m_tanks[j];
            ++m_lastPairTests;
            if (!SATCollisionCalculator::isCollidingHorizontal(a.context.getOBB(), b.context.getOBB())) {
                continue;
            }
            ++m_lastContacts;
            m_router->handleTankHitTank(*a.entity, a.context, *b.entity, b.context);
        }
    }
}

void CollisionManager::runTankItemPass() {
    for (const auto& tankSlot : m_tanks) {
        for (const auto& itemSlot : m_items) {
            ++m_lastPairTests;
            if (SATCollisionCalculator::isCollidingHorizontal(tankSlot.context.getOBB(),
                                                              itemSlot.context.getOBB())) {
                ++m_lastContacts;
                m_router->handleTankHitItem(tankSlot.context, *itemSlot.entity);
            }
        }
    }
}

void CollisionManager::runBulletPasses() {
    for (const auto& bulletSlot : m_bullets) {
        const Bullet& bullet = *bulletSlot.entity;
        const OBB& bulletBox = bulletSlot.context.getOBB();

        for (const auto& obstacleSlot : m_obstacles) {
            if (m_router->isSpent(bullet.getID())) {
                break;
            }
            ++m_lastPairTests;
            if (SATCollisionCalculator::isCollidingHorizontal(bulletBox, obstacleSlot.context.getOBB())) {
                ++m_lastContacts;
                m_router->handleBulletHitObstacle(bullet, bulletSlot.context, *obstacleSlot.entity);
            }
        }

        for (const auto& tankSlot : m_tanks) {
            if (m_router->isSpent(bullet.getID())) {
                break;
            }
            ++m_lastPairTests;
            if (SATCollisionCalculator::isCollidingHorizontal(bulletBox, tankSlot.context.getOBB())) {
                ++m_lastContacts;
                m_router->handleBulletHitTank(bullet, bulletSlot.context, tankSlot.context);
            }
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

MovementLockAxis CollisionManager::getLockAxis(EntityID tankId) const {
    const CollisionContext* context = findContext(m_tanks, tankId);
    return context != nullptr ? context->getLockAxis() : MovementLockAxis::None;
}

const CollisionContext* CollisionManager::getContext(EntityID id) const {
    if (const CollisionContext* context = findContext(m_tanks, id)) {
        return context;
    }
    if (const CollisionContext* context = findContext(m_obstacles, id)) {
        return context;
    }
    if (const CollisionContext* context = findContext(m_items, id)) {
        return context;
    }
    return findContext(m_bullets, id);
}

bool CollisionManager::overlaps(EntityID a, EntityID b) const {
    const CollisionContext* contextA = getContext(a);
    const CollisionContext* contextB = getContext(b);
    if (contextA == nullptr || contextB == nullptr || contextA == contextB) {
        return false;
    }
    return SATCollisionCalculator::isCollidingHorizontal(contextA->getOBB(), contextB->getOBB());
}

void CollisionManager::queryCircleHorizontal(const Vector3D& center, float radius,
                                             std::vector<const CollisionContext*>& out) const {
    out.clear();

    boost::container::small_vector<const OBB*, 32> boxes;
    boost::container::small_vector<const CollisionContext*, 32> owners;
    for (const auto& slot : m_tanks) {
        boxes.push_back(&slot.context.getOBB());
        owners.push_back(&slot.context);
    }
    for (const auto& slot : m_obstacles) {
        if (slot.entity->isBase()) {
            continue;
        }
        boxes.push_back(&slot.context.getOBB());
        owners.push_back(&slot.context);
    }

    SATCollisionCalculator::collectOverlappingCircleHorizontal(
        center, radius, std::span<const OBB* const>(boxes.data(), boxes.size()), m_queryHits);

    // Hits come back in input order, so one forward scan maps them to owners
    size_t cursor = 0;
    for (const OBB* hit : m_queryHits) {
        while (boxes[cursor] != hit) {
            ++cursor;
        }
        out.push_back(owners[cursor++]);
    }
}

void CollisionManager::queryCircleHorizontal(const Vector3D& center, float radius,
                                             std::vector<EntityID>& out) const {
    std::vector<const CollisionContext*> contexts;
    queryCircleHorizontal(center, radius, contexts);

    out.clear();
    out.reserve(contexts.size());
    for (const CollisionContext* context : contexts) {
        out.push_back(context->getEntityID());
    }
}

void CollisionManager::logCollisionStatistics() const {
    COLLISION_INFO(std::format("Frame {}: {} tanks, {} obstacles, {} items, {} bullets",
                               m_frameCount, m_tanks.size(), m_obstacles.size(),
                               m_items.size(), m_bullets.size()));
    COLLISION_INFO(std::format("Last pass: {} pair tests, {} contacts", m_lastPairTests, m_lastContacts));
}

} // namespace Ironclad
