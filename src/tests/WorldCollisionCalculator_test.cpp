#include "core/Body.h"
#include "core/SpatialHash.h"
#include "core/WorldCollisionCalculator.h"
#include <cmath>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

using namespace BouncePit;

namespace {

Body makeBody(double x, double y, double radius, double vx = 0.0, double vy = 0.0)
{
    Body body;
    body.position = Vector2d{ x, y };
    body.velocity = Vector2d{ vx, vy };
    body.setRadius(radius);
    return body;
}

} // namespace

class WorldCollisionCalculatorTest : public ::testing::Test {
protected:
    WorldCollisionCalculator calculator;
};

TEST_F(WorldCollisionCalculatorTest, SeparatedPairIsUntouched)
{
    spdlog::info("Starting WorldCollisionCalculatorTest::SeparatedPairIsUntouched test");
    Body a = makeBody(0.0, 0.0, 10.0, 5.0, 0.0);
    Body b = makeBody(25.0, 0.0, 10.0, -5.0, 0.0);

    const ContactResult contact = calculator.resolveCircleCircle(a, b, 0.8);

    EXPECT_FALSE(contact.overlapping);
    EXPECT_FALSE(contact.impulse_applied);
    EXPECT_EQ(a.position, (Vector2d{ 0.0, 0.0 }));
    EXPECT_EQ(b.position, (Vector2d{ 25.0, 0.0 }));
    EXPECT_EQ(a.velocity, (Vector2d{ 5.0, 0.0 }));
    EXPECT_EQ(b.velocity, (Vector2d{ -5.0, 0.0 }));
}

TEST_F(WorldCollisionCalculatorTest, TouchingPairIsNotAContact)
{
    spdlog::info("Starting WorldCollisionCalculatorTest::TouchingPairIsNotAContact test");
    Body a = makeBody(0.0, 0.0, 10.0);
    Body b = makeBody(20.0, 0.0, 10.0);

    EXPECT_FALSE(calculator.resolveCircleCircle(a, b, 0.8).overlapping);
}

TEST_F(WorldCollisionCalculatorTest, EqualMassesShareTheCorrection)
{
    spdlog::info("Starting WorldCollisionCalculatorTest::EqualMassesShareTheCorrection test");
    Body a = makeBody(0.0, 0.0, 10.0);
    Body b = makeBody(15.0, 0.0, 10.0);

    const ContactResult contact = calculator.resolveCircleCircle(a, b, 0.8);

    EXPECT_TRUE(contact.overlapping);
    EXPECT_NEAR(contact.overlap, 5.0, 1e-12);
    EXPECT_NEAR(a.position.x, -2.5, 1e-9);
    EXPECT_NEAR(b.position.x, 17.5, 1e-9);
    EXPECT_NEAR(b.position.x - a.position.x, 20.0, 1e-9);
    EXPECT_EQ(a.position.y, 0.0);
}

TEST_F(WorldCollisionCalculatorTest, LighterBodyMovesFurther)
{
    spdlog::info("Starting WorldCollisionCalculatorTest::LighterBodyMovesFurther test");
    Body small = makeBody(0.0, 0.0, 5.0);
    Body large = makeBody(0.0, 20.0, 20.0);

    calculator.resolveCircleCircle(small, large, 0.8);

    const double smallMove = std::abs(small.position.y);
    const double largeMove = std::abs(large.position.y - 20.0);
    EXPECT_GT(smallMove, largeMove);
    EXPECT_NEAR(smallMove + largeMove, 5.0, 1e-9);
    // Displacements are in the ratio of inverse masses, 16:1 here.
    EXPECT_NEAR(smallMove / largeMove, 16.0, 1e-9);
}

TEST_F(WorldCollisionCalculatorTest, SeparatingPairKeepsVelocities)
{
    spdlog::info("Starting WorldCollisionCalculatorTest::SeparatingPairKeepsVelocities test");
    Body a = makeBody(0.0, 0.0, 10.0, -10.0, 0.0);
    Body b = makeBody(15.0, 0.0, 10.0, 10.0, 0.0);

    const ContactResult contact = calculator.resolveCircleCircle(a, b, 0.8);

    EXPECT_TRUE(contact.overlapping);
    EXPECT_FALSE(contact.impulse_applied);
    EXPECT_EQ(a.velocity, (Vector2d{ -10.0, 0.0 }));
    EXPECT_EQ(b.velocity, (Vector2d{ 10.0, 0.0 }));
}

TEST_F(WorldCollisionCalculatorTest, CoincidentCentresUseFallbackNormal)
{
    spdlog::info("Starting WorldCollisionCalculatorTest::CoincidentCentresUseFallbackNormal test");
    Body a = makeBody(50.0, 50.0, 10.0, 0.0, 3.0);
    Body b = makeBody(50.0, 50.0, 10.0, 0.0, -3.0);

    const ContactResult contact = calculator.resolveCircleCircle(a, b, 0.8);

    EXPECT_TRUE(contact.overlapping);
    EXPECT_TRUE(a.position.isFinite());
    EXPECT_TRUE(b.position.isFinite());
    EXPECT_TRUE(a.velocity.isFinite());
    EXPECT_TRUE(b.velocity.isFinite());
    // Pushed apart along +x.
    EXPECT_LT(a.position.x, 50.0);
    EXPECT_GT(b.position.x, 50.0);
    EXPECT_NEAR(b.position.x - a.position.x, 20.0, 1e-5);
    EXPECT_EQ(a.position.y, 50.0);
}

TEST_F(WorldCollisionCalculatorTest, KinematicBodyPushesWithoutBeingPushed)
{
    spdlog::info("Starting WorldCollisionCalculatorTest::KinematicBodyPushesWithoutBeingPushed test");
    Body dragged = makeBody(0.0, 0.0, 10.0, 100.0, 0.0);
    dragged.kinematic = true;
    Body other = makeBody(15.0, 0.0, 10.0);

    const ContactResult contact = calculator.resolveCircleCircle(dragged, other, 0.8);

    EXPECT_TRUE(contact.impulse_applied);
    EXPECT_EQ(dragged.position, (Vector2d{ 0.0, 0.0 }));
    EXPECT_EQ(dragged.velocity, (Vector2d{ 100.0, 0.0 }));
    EXPECT_NEAR(other.position.x, 20.0, 1e-9);
    // j = (1 + e) * 100 / invB, so the free body picks up 180 px/s.
    EXPECT_NEAR(other.velocity.x, 180.0, 1e-9);
}

TEST_F(WorldCollisionCalculatorTest, TwoKinematicBodiesAreSkipped)
{
    spdlog::info("Starting WorldCollisionCalculatorTest::TwoKinematicBodiesAreSkipped test");
    Body a = makeBody(0.0, 0.0, 10.0);
    Body b = makeBody(5.0, 0.0, 10.0);
    a.kinematic = true;
    b.kinematic = true;

    const ContactResult contact = calculator.resolveCircleCircle(a, b, 0.8);

    EXPECT_FALSE(contact.overlapping);
    EXPECT_EQ(a.position.x, 0.0);
    EXPECT_EQ(b.position.x, 5.0);
}

TEST_F(WorldCollisionCalculatorTest, HashedPairsResolvedPerSharedCell)
{
    spdlog::info("Starting WorldCollisionCalculatorTest::HashedPairsResolvedPerSharedCell test");
    // Both bodies straddle the four cells around (80, 80).
    std::vector<Body> bodies{ makeBody(75.0, 80.0, 10.0), makeBody(85.0, 80.0, 10.0) };
    SpatialHash hash(80.0);
    hash.build(bodies);

    const CollisionPassStats stats = calculator.resolveHashedPairs(bodies, hash, 0.8, false);

    EXPECT_EQ(stats.pair_tests, 4u);
    EXPECT_GE(stats.contacts, 1u);
    EXPECT_EQ(stats.duplicate_pairs_skipped, 0u);
    EXPECT_NEAR(bodies[1].position.x - bodies[0].position.x, 20.0, 1e-9);
}

TEST_F(WorldCollisionCalculatorTest, HashedPairsDeduplicated)
{
    spdlog::info("Starting WorldCollisionCalculatorTest::HashedPairsDeduplicated test");
    std::vector<Body> bodies{ makeBody(75.0, 80.0, 10.0), makeBody(85.0, 80.0, 10.0) };
    SpatialHash hash(80.0);
    hash.build(bodies);

    const CollisionPassStats stats = calculator.resolveHashedPairs(bodies, hash, 0.8, true);

    EXPECT_EQ(stats.pair_tests, 1u);
    EXPECT_EQ(stats.contacts, 1u);
    EXPECT_EQ(stats.duplicate_pairs_skipped, 3u);
}
