#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>

#include "gravsim/core/simulator.hpp"
#include "gravsim/scenarios/planetary_collision.hpp"

namespace {

void createScenario(BodyRegistry& bodies, int debris, std::uint64_t seed) {
    PlanetaryCollisionConfig config;
    config.debrisCount = debris;
    PlanetaryCollisionScenario scenario(config);
    std::mt19937_64 rng(seed);
    scenario.createBodies(bodies, rng);
}

} // namespace

TEST(SimulatorTest, TwoPlanetsApproachWithoutColliding) {
    BodyRegistry bodies;
    auto a = bodies.createBody(Position(0.0, 5.0, 0.0), Vector(-0.75, 0.0, 0.0), 1.0);
    auto b = bodies.createBody(Position(0.0, -5.0, 0.0), Vector(0.75, 0.0, 0.0), 1.0);

    Simulator sim;
    StepReport report = sim.step(bodies, 1.0);

    EXPECT_TRUE(report.collisions.empty());
    // Positions moved with the old velocities, then gravity acted
    EXPECT_NEAR(bodies.position(a).x, -0.75, 1e-12);
    EXPECT_NEAR(bodies.position(b).x, 0.75, 1e-12);

    // After the move the separation is (-1.5, 10, 0)
    double const m = bodies.mass(a);
    double const r = std::sqrt(1.5 * 1.5 + 100.0);
    double const k = m / (r * r * r);
    EXPECT_NEAR(bodies.velocity(a).x, -0.75 + 1.5 * k, 1e-12);
    EXPECT_NEAR(bodies.velocity(a).y, -10.0 * k, 1e-12);
    EXPECT_NEAR(bodies.velocity(b).y, 10.0 * k, 1e-12);
}

TEST(SimulatorTest, OverlappingPairIsSeparatedWithinTheStep) {
    BodyRegistry bodies;
    auto a = bodies.createBody(Position(0.0, 0.0, 0.0), Vector(), 1.0);
    auto b = bodies.createBody(Position(1.5, 0.0, 0.0), Vector(), 1.0);

    Simulator sim;
    StepReport report = sim.step(bodies, 1.0 / 60.0);

    ASSERT_EQ(report.collisions.size(), 1u);
    EXPECT_EQ(report.collisions[0].a, a);
    EXPECT_EQ(report.collisions[0].b, b);
    EXPECT_EQ(report.resolution.resolved, 1u);
    EXPECT_GE(bodies.position(a).dist(bodies.position(b)), 2.0 - 1e-9);
}

TEST(SimulatorTest, RejectsInvalidDt) {
    BodyRegistry bodies;
    auto a = bodies.createBody(Position(), Vector(1.0, 0.0, 0.0), 1.0);

    Simulator sim;
    EXPECT_THROW(sim.step(bodies, -0.1), std::invalid_argument);
    EXPECT_THROW(sim.step(bodies, std::nan("")), std::invalid_argument);
    EXPECT_THROW(sim.step(bodies, std::numeric_limits<double>::infinity()), std::invalid_argument);

    EXPECT_DOUBLE_EQ(bodies.position(a).x, 0.0);
    EXPECT_DOUBLE_EQ(bodies.velocity(a).x, 1.0);
}

TEST(SimulatorTest, ZeroDtLeavesSeparatedBodiesAlone) {
    BodyRegistry bodies;
    auto a = bodies.createBody(Position(), Vector(1.0, 0.0, 0.0), 1.0);
    bodies.createBody(Position(10.0, 0.0, 0.0), Vector(), 1.0);

    Simulator sim;
    StepReport report = sim.step(bodies, 0.0);

    EXPECT_TRUE(report.collisions.empty());
    EXPECT_DOUBLE_EQ(bodies.position(a).x, 0.0);
    EXPECT_DOUBLE_EQ(bodies.velocity(a).x, 1.0);
}

TEST(SimulatorTest, IsolatedBodyMovesInAStraightLine) {
    BodyRegistry bodies;
    auto a = bodies.createBody(Position(1.0, 1.0, 1.0), Vector(0.5, 0.25, -1.0), 0.3);

    Simulator sim;
    for (int i = 0; i < 10; ++i) {
        sim.step(bodies, 0.1);
    }

    EXPECT_NEAR(bodies.position(a).x, 1.5, 1e-12);
    EXPECT_NEAR(bodies.position(a).y, 1.25, 1e-12);
    EXPECT_NEAR(bodies.position(a).z, 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(bodies.velocity(a).x, 0.5);
}

TEST(SimulatorTest, EmptyRegistryIsFine) {
    BodyRegistry bodies;
    Simulator sim;
    StepReport report = sim.step(bodies, 0.1);
    EXPECT_TRUE(report.collisions.empty());
    EXPECT_EQ(report.gravityPairsSkipped, 0u);
}

TEST(SimulatorTest, ConservesMomentumWithCollisions) {
    BodyRegistry bodies;
    createScenario(bodies, 150, 5);
    Vector const before = bodies.totalMomentum();

    Simulator sim;
    for (int i = 0; i < 20; ++i) {
        sim.step(bodies, 1.0 / 60.0);
    }

    Vector const after = bodies.totalMomentum();
    EXPECT_NEAR(after.x, before.x, 1e-8);
    EXPECT_NEAR(after.y, before.y, 1e-8);
    EXPECT_NEAR(after.z, before.z, 1e-8);
    EXPECT_FALSE(bodies.hasNonFiniteState());
}

TEST(SimulatorTest, SameSeedSameTrajectory) {
    BodyRegistry first;
    BodyRegistry second;
    createScenario(first, 100, 42);
    createScenario(second, 100, 42);

    Simulator simA;
    Simulator simB;
    for (int i = 0; i < 15; ++i) {
        StepReport ra = simA.step(first, 1.0 / 60.0);
        StepReport rb = simB.step(second, 1.0 / 60.0);
        ASSERT_EQ(ra.collisions.size(), rb.collisions.size());
    }

    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first.position(i).x, second.position(i).x);
        EXPECT_EQ(first.position(i).y, second.position(i).y);
        EXPECT_EQ(first.position(i).z, second.position(i).z);
        EXPECT_EQ(first.velocity(i).x, second.velocity(i).x);
        EXPECT_EQ(first.velocity(i).y, second.velocity(i).y);
        EXPECT_EQ(first.velocity(i).z, second.velocity(i).z);
    }
}

TEST(SimulatorTest, ConfigReachesGravity) {
    SystemConfig config;
    config.GravitationalConstant = 0.0;
    Simulator sim(config);
    EXPECT_DOUBLE_EQ(sim.getConfig().GravitationalConstant, 0.0);

    BodyRegistry bodies;
    auto a = bodies.createBody(Position(0.0, 0.0, 0.0), Vector(), 1.0);
    bodies.createBody(Position(5.0, 0.0, 0.0), Vector(), 1.0);

    sim.step(bodies, 1.0);
    EXPECT_DOUBLE_EQ(bodies.velocity(a).x, 0.0);

    config.GravitationalConstant = 1.0;
    sim.applyConfig(config);
    sim.step(bodies, 1.0);
    EXPECT_GT(bodies.velocity(a).x, 0.0);
}
