/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CollisionResolveTests
#include <boost/test/unit_test.hpp>

#include "collisions/CollisionConfig.hpp"
#include "collisions/CollisionContext.hpp"
#include "collisions/CollisionResolveCalculator.hpp"
#include "collisions/CollisionResolveInfo.hpp"
#include "collisions/OBB.hpp"
#include "../mocks/MockCollisionOwner.hpp"

#include <cmath>
#include <random>

using namespace Ironclad;

namespace {
constexpr float kTolerance = 1e-3f;
const Vector3D kUnitSize(2.0f, 2.0f, 2.0f);

CollisionContext makeDynamic(EntityID id, MockCollisionOwner& owner) {
    return CollisionContext(id, CollisionKind::Tank, owner, OBBFactory::createDynamic(Vector3D(), kUnitSize));
}

CollisionContext makeStatic(EntityID id, const MockCollisionOwner& owner, const Vector3D& position) {
    return CollisionContext(id, CollisionKind::Obstacle, owner,
                            OBBFactory::createStatic(position, Quaternion(), Vector3D(), kUnitSize));
}

void commitLock(CollisionContext& context, MovementLockAxis axis) {
    context.beginFrame();
    context.addPendingLockAxis(axis);
    context.finalizeLockAxis();
}
} // namespace

struct ResolveFixture {
    ResolveFixture()
        : ownerA(Vector3D(0.0f, 0.0f, 0.0f), 0.0f),
          ownerB(Vector3D(1.5f, 0.0f, 0.0f), 0.0f),
          contextA(makeDynamic(1, ownerA)),
          contextB(makeDynamic(2, ownerB)) {}

    bool resolve(float speedA, float speedB, bool bImmovable = false) {
        return calculator.calculateResolveInfo(contextA, contextB, speedA, speedB, bImmovable, outA, outB);
    }

    MockCollisionOwner ownerA;
    MockCollisionOwner ownerB;
    CollisionContext contextA;
    CollisionContext contextB;
    CollisionResolveCalculator calculator;
    CollisionResolveInfo outA;
    CollisionResolveInfo outB;
};

// ============================================================================
// Speed based distribution
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DistributionTests, ResolveFixture)

BOOST_AUTO_TEST_CASE(TestSlowerBodyAbsorbsPush)
{
    // A faster than B: B absorbs the whole push, away from A
    BOOST_REQUIRE(resolve(5.0f, 2.0f));
    BOOST_CHECK(!outA.isValid());
    BOOST_CHECK_SMALL(outA.getResolveVector().getX(), 1e-6f);
    BOOST_REQUIRE(outB.isValid());
    BOOST_CHECK_CLOSE(outB.getResolveVector().getX(), 0.5f, kTolerance);
    BOOST_CHECK_CLOSE(outB.getDistance(), 0.5f, kTolerance);
    BOOST_CHECK_CLOSE(outB.getDirection().getX(), 1.0f, kTolerance);
}

BOOST_AUTO_TEST_CASE(TestSlowerAIsPushed)
{
    BOOST_REQUIRE(resolve(-1.0f, 4.0f));
    BOOST_CHECK_CLOSE(outA.getResolveVector().getX(), -0.5f, kTolerance);
    BOOST_CHECK(!outB.isValid());
}

BOOST_AUTO_TEST_CASE(TestEqualSpeedsPushA)
{
    BOOST_REQUIRE(resolve(3.0f, -3.0f));
    BOOST_CHECK_CLOSE(outA.getResolveVector().getX(), -0.5f, kTolerance);
    BOOST_CHECK(!outB.isValid());
}

BOOST_AUTO_TEST_CASE(TestStationaryBodyIsPushed)
{
    BOOST_REQUIRE(resolve(4.0f, 0.0f));
    BOOST_CHECK(!outA.isValid());
    BOOST_CHECK_CLOSE(outB.getResolveVector().getX(), 0.5f, kTolerance);

    BOOST_REQUIRE(resolve(0.0f, 4.0f));
    BOOST_CHECK_CLOSE(outA.getResolveVector().getX(), -0.5f, kTolerance);
    BOOST_CHECK(!outB.isValid());
}

BOOST_AUTO_TEST_CASE(TestNeitherMovingPushesNobody)
{
    BOOST_CHECK(resolve(0.0f, 0.0f));
    BOOST_CHECK(!outA.isValid());
    BOOST_CHECK(!outB.isValid());
}

BOOST_AUTO_TEST_CASE(TestSpeedBelowEpsilonCountsAsStationary)
{
    BOOST_REQUIRE(resolve(1e-8f, 2.0f));
    BOOST_CHECK_CLOSE(outA.getResolveVector().getX(), -0.5f, kTolerance);
    BOOST_CHECK(!outB.isValid());
}

BOOST_AUTO_TEST_CASE(TestNoOverlapClearsOutputs)
{
    BOOST_REQUIRE(resolve(5.0f, 2.0f));
    ownerB.setPosition(Vector3D(3.0f, 0.0f, 0.0f));

    BOOST_CHECK(!resolve(5.0f, 2.0f));
    BOOST_CHECK(!outA.isValid());
    BOOST_CHECK(!outB.isValid());
    BOOST_CHECK(outA.getResolveVector().isZero());
    BOOST_CHECK(outB.getResolveVector().isZero());
}

BOOST_AUTO_TEST_CASE(TestRepeatedSeparatedResolveStaysEmpty)
{
    ownerB.setPosition(Vector3D(3.0f, 0.0f, 0.0f));

    for (int call = 0; call < 2; ++call) {
        BOOST_TEST_CONTEXT("call " << call) {
            BOOST_CHECK(!resolve(5.0f, 2.0f));
            BOOST_CHECK(!outA.isValid());
            BOOST_CHECK(!outB.isValid());
            BOOST_CHECK(outA.getResolveVector().isZero());
            BOOST_CHECK(outB.getResolveVector().isZero());
        }
    }
}

BOOST_AUTO_TEST_CASE(TestResolveRefreshesPlannedPose)
{
    // Contexts were built with B at 1.5; the planned pose moved since
    ownerB.setPosition(Vector3D(0.0f, 0.0f, -1.2f));
    BOOST_REQUIRE(resolve(0.0f, 1.0f));
    BOOST_CHECK_CLOSE(outA.getResolveVector().getZ(), 0.8f, kTolerance);
    BOOST_CHECK_SMALL(outA.getResolveVector().getX(), 1e-6f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Lock axis short-circuit
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(LockAxisTests, ResolveFixture)

BOOST_AUTO_TEST_CASE(TestLockedAPassesPushToB)
{
    commitLock(contextA, MovementLockAxis::X);
    // Distribution alone would push A (slower)
    BOOST_REQUIRE(resolve(0.1f, 5.0f));
    BOOST_CHECK(!outA.isValid());
    BOOST_CHECK_CLOSE(outB.getResolveVector().getX(), 0.5f, kTolerance);
}

BOOST_AUTO_TEST_CASE(TestLockedBPassesPushToA)
{
    commitLock(contextB, MovementLockAxis::All);
    BOOST_REQUIRE(resolve(5.0f, 0.1f));
    BOOST_CHECK_CLOSE(outA.getResolveVector().getX(), -0.5f, kTolerance);
    BOOST_CHECK(!outB.isValid());
}

BOOST_AUTO_TEST_CASE(TestLockIsPerAxis)
{
    // X lock must not affect a push along Z
    ownerB.setPosition(Vector3D(0.0f, 0.0f, 1.5f));
    commitLock(contextA, MovementLockAxis::X);
    BOOST_REQUIRE(resolve(1.0f, 5.0f));
    BOOST_CHECK_CLOSE(outA.getResolveVector().getZ(), -0.5f, kTolerance);
    BOOST_CHECK(!outB.isValid());
}

BOOST_AUTO_TEST_CASE(TestPendingLockIsNotRead)
{
    contextA.beginFrame();
    contextA.addPendingLockAxis(MovementLockAxis::X);
    // Not finalized: A is still unlocked and slower
    BOOST_REQUIRE(resolve(0.1f, 5.0f));
    BOOST_CHECK_CLOSE(outA.getResolveVector().getX(), -0.5f, kTolerance);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Immovable bodies and snapping
// ============================================================================

BOOST_AUTO_TEST_SUITE(ImmovableTests)

BOOST_AUTO_TEST_CASE(TestImmovableBAlwaysPushesA)
{
    MockCollisionOwner tank(Vector3D(0.0f, 0.0f, 0.0f), 0.0f);
    MockCollisionOwner wall;
    CollisionContext tankContext = makeDynamic(1, tank);
    CollisionContext wallContext = makeStatic(2, wall, Vector3D(0.0f, 0.0f, 1.7f));
    CollisionResolveCalculator calculator;
    CollisionResolveInfo outA;
    CollisionResolveInfo outB;

    BOOST_REQUIRE(calculator.calculateResolveInfo(tankContext, wallContext, 0.0f, 0.0f, true, outA, outB));
    BOOST_CHECK_CLOSE(outA.getResolveVector().getZ(), -0.3f, 1e-2f);
    BOOST_CHECK(!outB.isValid());
}

BOOST_AUTO_TEST_CASE(TestLockedAAgainstImmovableBPushesNobody)
{
    MockCollisionOwner tank(Vector3D(0.0f, 0.0f, 0.0f), 0.0f);
    MockCollisionOwner wall;
    CollisionContext tankContext = makeDynamic(1, tank);
    CollisionContext wallContext = makeStatic(2, wall, Vector3D(1.5f, 0.0f, 0.0f));
    commitLock(tankContext, MovementLockAxis::X);

    CollisionResolveCalculator calculator;
    CollisionResolveInfo outA;
    CollisionResolveInfo outB;
    BOOST_REQUIRE(calculator.calculateResolveInfo(tankContext, wallContext, 5.0f, 0.0f, true, outA, outB));
    BOOST_CHECK(!outA.isValid());
    BOOST_CHECK(!outB.isValid());
}

BOOST_AUTO_TEST_CASE(TestTinyPushIsSnappedToMinimum)
{
    MockCollisionOwner tank(Vector3D(0.0f, 0.0f, 0.0f), 0.0f);
    MockCollisionOwner wall;
    CollisionContext tankContext = makeDynamic(1, tank);
    CollisionContext wallContext = makeStatic(2, wall, Vector3D(1.9996f, 0.0f, 0.0f));

    CollisionResolveCalculator calculator;
    CollisionResolveInfo outA;
    CollisionResolveInfo outB;
    BOOST_REQUIRE(calculator.calculateResolveInfo(tankContext, wallContext, 1.0f, 0.0f, true, outA, outB));
    BOOST_CHECK_CLOSE(outA.getDistance(), CollisionConfig::DEFAULT_MIN_RESOLVE_DISTANCE, 0.1f);
    BOOST_CHECK_LT(outA.getResolveVector().getX(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestConfiguredMinimumDistance)
{
    MockCollisionOwner tank(Vector3D(0.0f, 0.0f, 0.0f), 0.0f);
    MockCollisionOwner wall;
    CollisionContext tankContext = makeDynamic(1, tank);
    CollisionContext wallContext = makeStatic(2, wall, Vector3D(0.0f, 0.0f, 1.99f));

    CollisionConfig config;
    config.minResolveDistance = 0.05f;
    CollisionResolveCalculator calculator(config);
    CollisionResolveInfo outA;
    CollisionResolveInfo outB;
    BOOST_REQUIRE(calculator.calculateResolveInfo(tankContext, wallContext, 1.0f, 0.0f, true, outA, outB));
    BOOST_CHECK_CLOSE(outA.getDistance(), 0.05f, 0.1f);
}

BOOST_AUTO_TEST_CASE(TestPushAlwaysPointsAwayFromOther)
{
    std::mt19937 rng(7);
    std::uniform_real_distribution<float> position(-1.8f, 1.8f);

    MockCollisionOwner tank;
    MockCollisionOwner wall;
    CollisionResolveCalculator calculator;

    int pushed = 0;
    for (int i = 0; i < 200; ++i) {
        const Vector3D tankPosition(position(rng), 0.0f, position(rng));
        tank.setPosition(tankPosition);
        CollisionContext tankContext = makeDynamic(1, tank);
        CollisionContext wallContext = makeStatic(2, wall, Vector3D());

        CollisionResolveInfo outA;
        CollisionResolveInfo outB;
        if (!calculator.calculateResolveInfo(tankContext, wallContext, 2.0f, 0.0f, true, outA, outB)) {
            continue;
        }
        if (outA.isValid()) {
            ++pushed;
            BOOST_CHECK_GE(outA.getResolveVector().dot(tankPosition.horizontal()), 0.0f);
        }
    }
    BOOST_CHECK_GT(pushed, 0);
}

BOOST_AUTO_TEST_SUITE_END()
