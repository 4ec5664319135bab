/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityMovementTests
#include <boost/test/unit_test.hpp>

#include "collisions/CollisionResolveInfo.hpp"
#include "entities/Bullet.hpp"
#include "entities/BulletKind.hpp"
#include "entities/Item.hpp"
#include "entities/Tank.hpp"
#include "world/StageBoundary.hpp"

#include <cmath>
#include <numbers>
#include <string>

using namespace Ironclad;

namespace {
const Vector3D kTankSize(2.0f, 1.5f, 3.0f);
const float kHalfPi = std::numbers::pi_v<float> * 0.5f;
}

// ============================================================================
// Tank
// ============================================================================

BOOST_AUTO_TEST_SUITE(TankMovementTests)

BOOST_AUTO_TEST_CASE(TestEntityIdsAreUnique)
{
    Tank a(Vector3D(), 0.0f, kTankSize);
    Tank b(Vector3D(), 0.0f, kTankSize);
    BOOST_CHECK_NE(a.getID(), INVALID_ENTITY_ID);
    BOOST_CHECK_NE(a.getID(), b.getID());
}

BOOST_AUTO_TEST_CASE(TestPlanForward)
{
    Tank tank(Vector3D(), 0.0f, kTankSize);
    tank.planMovement(0.5f, 1.0f, 0.0f, MovementLockAxis::None);

    BOOST_CHECK_CLOSE(tank.getForwardSpeed(), 8.0f, 1e-4f);
    BOOST_CHECK_CLOSE(tank.getPlannedNextPosition().getZ(), 4.0f, 1e-3f);
    // Nothing moves until commit
    BOOST_CHECK_SMALL(tank.getPosition().getZ(), 1e-6f);

    tank.commitMovement();
    BOOST_CHECK_CLOSE(tank.getPosition().getZ(), 4.0f, 1e-3f);
}

BOOST_AUTO_TEST_CASE(TestPlanSideways)
{
    Tank tank(Vector3D(), kHalfPi, kTankSize);
    tank.planMovement(0.5f, 1.0f, 0.0f, MovementLockAxis::None);
    BOOST_CHECK_CLOSE(tank.getPlannedNextPosition().getX(), 4.0f, 1e-3f);
    BOOST_CHECK_SMALL(tank.getPlannedNextPosition().getZ(), 1e-4f);
}

BOOST_AUTO_TEST_CASE(TestLockedAxisDropsDisplacement)
{
    Tank tank(Vector3D(), std::numbers::pi_v<float> * 0.25f, kTankSize);
    tank.planMovement(1.0f, 1.0f, 0.0f, MovementLockAxis::Z);
    BOOST_CHECK_GT(tank.getPlannedNextPosition().getX(), 5.0f);
    BOOST_CHECK_EQUAL(tank.getPlannedNextPosition().getZ(), 0.0f);

    tank.planMovement(1.0f, 1.0f, 0.0f, MovementLockAxis::All);
    BOOST_CHECK(tank.getPlannedNextPosition() == tank.getPosition());
}

BOOST_AUTO_TEST_CASE(TestInputsClampedAndTurn)
{
    Tank tank(Vector3D(), 0.0f, kTankSize);
    tank.planMovement(0.5f, 3.0f, 5.0f, MovementLockAxis::None);
    BOOST_CHECK_CLOSE(tank.getForwardSpeed(), 8.0f, 1e-4f);
    BOOST_CHECK_CLOSE(tank.getPlannedNextRotation().getYaw(), 1.0f, 1e-3f);

    tank.planMovement(0.5f, -0.5f, 0.0f, MovementLockAxis::None);
    BOOST_CHECK_CLOSE(tank.getForwardSpeed(), -4.0f, 1e-4f);
}

BOOST_AUTO_TEST_CASE(TestBrokenTankHoldsPose)
{
    Tank tank(Vector3D(1.0f, 0.0f, 1.0f), 0.0f, kTankSize);
    tank.setBroken(true);
    tank.planMovement(0.5f, 1.0f, 1.0f, MovementLockAxis::None);

    BOOST_CHECK(tank.getPlannedNextPosition() == tank.getPosition());
    BOOST_CHECK_EQUAL(tank.getForwardSpeed(), 0.0f);

    tank.applyCollisionResolve(CollisionResolveInfo(Vector3D(1.0f, 0.0f, 0.0f)));
    BOOST_CHECK(tank.getPlannedNextPosition() == tank.getPosition());
}

BOOST_AUTO_TEST_CASE(TestResolveAddsToPlan)
{
    Tank tank(Vector3D(), 0.0f, kTankSize);
    tank.applyCollisionResolve(CollisionResolveInfo(Vector3D(0.0f, 0.0f, -0.25f)));
    BOOST_CHECK_CLOSE(tank.getPlannedNextPosition().getZ(), -0.25f, 1e-4f);

    tank.applyCollisionResolve(CollisionResolveInfo());
    BOOST_CHECK_CLOSE(tank.getPlannedNextPosition().getZ(), -0.25f, 1e-4f);
}

BOOST_AUTO_TEST_CASE(TestConstrainToBoundary)
{
    Tank tank(Vector3D(9.5f, 0.0f, 0.0f), kHalfPi, kTankSize);
    tank.planMovement(1.0f, 1.0f, 0.0f, MovementLockAxis::None);
    tank.constrainTo(StageBoundary(10.0f));
    BOOST_CHECK_CLOSE(tank.getPlannedNextPosition().getX(), 10.0f, 1e-3f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Bullet
// ============================================================================

BOOST_AUTO_TEST_SUITE(BulletMovementTests)

BOOST_AUTO_TEST_CASE(TestDamageFromKind)
{
    BOOST_CHECK_CLOSE(getDamage(BulletKind{ExplosiveBullet{35.0f, 3.0f}}), 35.0f, 1e-4f);
    BOOST_CHECK_CLOSE(getDamage(BulletKind{PenetrationBullet{20.0f, 2}}), 20.0f, 1e-4f);
    BOOST_CHECK_CLOSE(getDamage(BulletKind{HomingBullet{25.0f, 90.0f}}), 25.0f, 1e-4f);
}

BOOST_AUTO_TEST_CASE(TestStraightFlight)
{
    Bullet bullet(1, PenetrationBullet{10.0f}, Vector3D(), 0.0f, 10.0f, Vector3D(0.3f, 0.3f, 0.6f));
    bullet.setHomingTarget(Vector3D(10.0f, 0.0f, 0.0f));
    bullet.planMovement(0.1f);

    BOOST_CHECK_CLOSE(bullet.getPlannedNextPosition().getZ(), 1.0f, 1e-3f);
    BOOST_CHECK_SMALL(bullet.getPlannedNextPosition().getX(), 1e-5f);
    BOOST_CHECK_EQUAL(bullet.getShooterID(), 1u);
}

BOOST_AUTO_TEST_CASE(TestHomingTurnIsRateLimited)
{
    Bullet bullet(1, HomingBullet{10.0f, 90.0f}, Vector3D(), 0.0f, 10.0f, Vector3D(0.3f, 0.3f, 0.6f));
    bullet.setHomingTarget(Vector3D(10.0f, 0.0f, 0.0f));
    bullet.planMovement(0.5f);

    const float quarterPi = std::numbers::pi_v<float> * 0.25f;
    BOOST_CHECK_CLOSE(bullet.getPlannedNextRotation().getYaw(), quarterPi, 1e-3f);

    bullet.commitMovement();
    BOOST_CHECK_CLOSE(bullet.getYaw(), quarterPi, 1e-3f);

    bullet.clearHomingTarget();
    bullet.planMovement(0.5f);
    BOOST_CHECK_CLOSE(bullet.getPlannedNextRotation().getYaw(), quarterPi, 1e-3f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Item
// ============================================================================

BOOST_AUTO_TEST_SUITE(ItemTests)

BOOST_AUTO_TEST_CASE(TestPickupDelayCountsDown)
{
    Item item(ItemType::Repair, Vector3D(), 0.0f, Vector3D(1.0f, 1.0f, 1.0f), 1.0f);
    BOOST_CHECK(!item.canPickup());
    item.update(0.6f);
    BOOST_CHECK(!item.canPickup());
    item.update(0.6f);
    BOOST_CHECK(item.canPickup());
    BOOST_CHECK_EQUAL(std::string(toString(item.getType())), "Repair");
}

BOOST_AUTO_TEST_CASE(TestNegativeDelayIsImmediate)
{
    Item item(ItemType::Ammo, Vector3D(), 0.0f, Vector3D(1.0f, 1.0f, 1.0f), -2.0f);
    BOOST_CHECK(item.canPickup());
}

BOOST_AUTO_TEST_SUITE_END()
