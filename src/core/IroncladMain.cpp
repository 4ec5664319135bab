/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "collisions/CollisionConfig.hpp"
#include "core/Logger.hpp"
#include "entities/Bullet.hpp"
#include "entities/Item.hpp"
#include "entities/Obstacle.hpp"
#include "entities/Tank.hpp"
#include "gameplay/MatchScoreboard.hpp"
#include "managers/CollisionManager.hpp"
#include "managers/SettingsManager.hpp"
#include "world/StageBoundary.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <memory>
#include <numbers>
#include <string>
#include <vector>

using namespace Ironclad;

namespace {

const std::string GAME_NAME{"Ironclad Arena"};
constexpr int DEFAULT_FRAMES{600};
constexpr float FIXED_TIMESTEP{1.0f / 60.0f};
constexpr float DEFAULT_STAGE_RADIUS{40.0f};
constexpr float TANK_HEALTH{100.0f};
constexpr float BULLET_SPEED{30.0f};
constexpr int FIRE_INTERVAL_FRAMES{45};

struct Driver {
    std::unique_ptr<Tank> tank;
    float throttle;
    float turn;
};

BulletKind nextBulletKind(int shot) {
    switch (shot % 3) {
    case 0:
        return ExplosiveBullet{35.0f, 3.0f};
    case 1:
        return PenetrationBullet{20.0f, 2};
    default:
        return HomingBullet{25.0f, 90.0f};
    }
}

} // anonymous namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  ARENA_INFO(std::format("Initializing {}", GAME_NAME));

  auto& settings = SettingsManager::Instance();
  if (!settings.loadFromFile("res/settings.json")) {
    ARENA_WARN("Failed to load settings.json - using defaults");
  }

  CollisionConfig config = CollisionConfig::fromSettings(settings);
  if (config.stageRadius <= 0.0f) {
    config.stageRadius = DEFAULT_STAGE_RADIUS;
  }
  const int frames = std::max(1, settings.get<int>("arena", "frames", DEFAULT_FRAMES));

  auto& collisionManager = CollisionManager::Instance();
  if (!collisionManager.init(config)) {
    ARENA_CRITICAL("Failed to initialize CollisionManager");
    return -1;
  }

  const StageBoundary boundary(config.stageRadius);
  MatchScoreboard scoreboard;

  // Two tanks facing each other plus a third circling the middle
  const Vector3D tankSize(2.0f, 1.5f, 3.0f);
  const Vector3D hitboxCenter(0.0f, 0.75f, 0.0f);
  std::vector<Driver> drivers;
  drivers.push_back({std::make_unique<Tank>(Vector3D(-10.0f, 0.0f, 0.0f), std::numbers::pi_v<float> * 0.5f,
                                            tankSize, hitboxCenter), 1.0f, 0.0f});
  drivers.push_back({std::make_unique<Tank>(Vector3D(10.0f, 0.0f, 0.0f), -std::numbers::pi_v<float> * 0.5f,
                                            tankSize, hitboxCenter), 0.6f, 0.0f});
  drivers.push_back({std::make_unique<Tank>(Vector3D(0.0f, 0.0f, -15.0f), 0.0f,
                                            tankSize, hitboxCenter), 0.8f, 0.4f});

  std::vector<std::unique_ptr<Obstacle>> obstacles;
  obstacles.push_back(std::make_unique<Obstacle>(Vector3D(0.0f, 0.0f, 0.0f), 0.3f, Vector3D(3.0f, 2.0f, 3.0f)));
  obstacles.push_back(std::make_unique<Obstacle>(Vector3D(0.0f, 0.0f, 20.0f), 0.0f, Vector3D(12.0f, 2.0f, 1.0f)));
  obstacles.push_back(std::make_unique<Obstacle>(Vector3D(-20.0f, 0.0f, -20.0f), 0.0f, Vector3D(6.0f, 3.0f, 6.0f),
                                                 Vector3D(), true));

  std::vector<std::unique_ptr<Item>> items;
  items.push_back(std::make_unique<Item>(ItemType::Repair, Vector3D(0.0f, 0.0f, 8.0f), 0.0f, Vector3D(1.0f, 1.0f, 1.0f)));
  items.push_back(std::make_unique<Item>(ItemType::Ammo, Vector3D(5.0f, 0.0f, -5.0f), 0.0f, Vector3D(1.0f, 1.0f, 1.0f), 2.0f));

  std::vector<std::unique_ptr<Bullet>> bullets;
  std::vector<EntityID> expiredBullets;
  std::vector<EntityID> collectedItems;
  int pickups = 0;

  for (auto& driver : drivers) {
    if (!collisionManager.registerTank(*driver.tank)) {
      ARENA_ERROR(std::format("Failed to register tank {}", driver.tank->getID()));
    }
    scoreboard.addTank(*driver.tank, TANK_HEALTH);
  }
  for (const auto& obstacle : obstacles) {
    if (!collisionManager.registerObstacle(*obstacle)) {
      ARENA_ERROR(std::format("Failed to register obstacle {}", obstacle->getID()));
    }
  }
  for (const auto& item : items) {
    if (!collisionManager.registerItem(*item)) {
      ARENA_ERROR(std::format("Failed to register item {}", item->getID()));
    }
  }

  auto& router = collisionManager.getEventRouter();
  router.addBulletHitCallback([&scoreboard](const BulletHitInfo& hit) { scoreboard.applyHit(hit); });
  router.addBulletDespawnCallback([&expiredBullets](EntityID bulletId) { expiredBullets.push_back(bulletId); });
  router.addItemPickupCallback([&collectedItems, &pickups](const ItemPickupInfo& pickup) {
    ++pickups;
    collectedItems.push_back(pickup.itemId);
    ARENA_INFO(std::format("Tank {} picked up item {}", pickup.tankId, pickup.itemId));
  });

  const Uint64 frequency = SDL_GetPerformanceFrequency();
  Uint64 collisionTicks = 0;
  int shotsFired = 0;

  for (int frame = 0; frame < frames; ++frame) {
    // Plan
    for (auto& driver : drivers) {
      Tank& tank = *driver.tank;
      tank.planMovement(FIXED_TIMESTEP, driver.throttle, driver.turn, collisionManager.getLockAxis(tank.getID()));
      tank.constrainTo(boundary);
    }
    for (auto& item : items) {
      item->update(FIXED_TIMESTEP);
    }

    if (frame % FIRE_INTERVAL_FRAMES == 0) {
      const Tank& shooter = *drivers[static_cast<size_t>(shotsFired) % drivers.size()].tank;
      if (!shooter.isBroken()) {
        const Vector3D muzzle = shooter.getPosition() + shooter.getRotation().forward() * 2.0f;
        auto bullet = std::make_unique<Bullet>(shooter.getID(), nextBulletKind(shotsFired), muzzle,
                                               shooter.getRotation().getYaw(), BULLET_SPEED,
                                               Vector3D(0.3f, 0.3f, 0.6f));
        if (collisionManager.registerBullet(*bullet)) {
          bullets.push_back(std::move(bullet));
        }
      }
      ++shotsFired;
    }
    for (auto& bullet : bullets) {
      if (std::holds_alternative<HomingBullet>(bullet->getKind())) {
        const Tank& target = *drivers.front().tank;
        if (target.getID() != bullet->getShooterID()) {
          bullet->setHomingTarget(target.getPosition());
        }
      }
      bullet->planMovement(FIXED_TIMESTEP);
    }

    // Collide
    const Uint64 start = SDL_GetPerformanceCounter();
    collisionManager.update();
    collisionTicks += SDL_GetPerformanceCounter() - start;

    // Commit
    for (auto& driver : drivers) {
      driver.tank->commitMovement();
    }
    for (auto& bullet : bullets) {
      bullet->commitMovement();
      if (!boundary.contains(bullet->getPosition())) {
        expiredBullets.push_back(bullet->getID());
      }
    }

    // Return spent bullets and collected items
    for (EntityID id : expiredBullets) {
      auto it = std::find_if(bullets.begin(), bullets.end(),
                             [id](const auto& bullet) { return bullet->getID() == id; });
      if (it == bullets.end()) {
        continue;
      }
      if (!collisionManager.unregisterBullet(id)) {
        ARENA_WARN(std::format("Bullet {} was not registered", id));
      }
      bullets.erase(it);
    }
    expiredBullets.clear();

    for (EntityID id : collectedItems) {
      auto it = std::find_if(items.begin(), items.end(),
                             [id](const auto& item) { return item->getID() == id; });
      if (it != items.end() && collisionManager.unregisterItem(id)) {
        items.erase(it);
      }
    }
    collectedItems.clear();

    if (scoreboard.getAliveCount() <= 1) {
      ARENA_INFO(std::format("Match over after {} frames", frame + 1));
      break;
    }
  }

  collisionManager.logCollisionStatistics();
  const double collisionMs = frequency > 0
      ? static_cast<double>(collisionTicks) * 1000.0 / static_cast<double>(frequency)
      : 0.0;
  ARENA_INFO(std::format("Collision time {:.3f} ms over {} frames",
                         collisionMs, collisionManager.getFrameCount()));
  ARENA_INFO(std::format("Shots fired: {}, obstacle hits: {}, pickups: {}",
                         shotsFired, scoreboard.getObstacleHits(), pickups));
  for (const auto& driver : drivers) {
    const EntityID id = driver.tank->getID();
    ARENA_INFO(std::format("Tank {} health {:.1f} kills {}",
                           id, scoreboard.getHealth(id), scoreboard.getKills(id)));
  }

  collisionManager.clean();
  return 0;
}
