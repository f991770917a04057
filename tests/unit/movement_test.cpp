#include <gtest/gtest.h>
#include "gravsim/core/body_registry.hpp"
#include "gravsim/systems/movement.hpp"

using namespace Systems;

class MovementSystemTest : public ::testing::Test {
protected:
    BodyRegistry bodies;
    MovementSystem movement;
};

TEST_F(MovementSystemTest, AdvancesPositionByVelocityTimesDt) {
    auto a = bodies.createBody(Position(1.0, 2.0, 3.0), Vector(0.5, -1.0, 2.0), 0.1);
    auto b = bodies.createBody(Position(-4.0, 0.0, 0.0), Vector(), 0.1);

    movement.update(bodies, 0.5);

    EXPECT_DOUBLE_EQ(bodies.position(a).x, 1.25);
    EXPECT_DOUBLE_EQ(bodies.position(a).y, 1.5);
    EXPECT_DOUBLE_EQ(bodies.position(a).z, 4.0);

    // Resting body stays put
    EXPECT_DOUBLE_EQ(bodies.position(b).x, -4.0);
    EXPECT_DOUBLE_EQ(bodies.position(b).y, 0.0);
}

TEST_F(MovementSystemTest, DoesNotTouchVelocity) {
    auto a = bodies.createBody(Position(), Vector(3.0, 4.0, 5.0), 1.0);
    // Overlapping neighbour: movement has no interaction between bodies
    bodies.createBody(Position(0.5, 0.0, 0.0), Vector(), 1.0);

    movement.update(bodies, 2.0);

    EXPECT_DOUBLE_EQ(bodies.velocity(a).x, 3.0);
    EXPECT_DOUBLE_EQ(bodies.velocity(a).y, 4.0);
    EXPECT_DOUBLE_EQ(bodies.velocity(a).z, 5.0);
    EXPECT_DOUBLE_EQ(bodies.position(a).x, 6.0);
}

TEST_F(MovementSystemTest, ZeroDtIsNoOp) {
    auto a = bodies.createBody(Position(1.0, 1.0, 1.0), Vector(9.0, 9.0, 9.0), 1.0);
    movement.update(bodies, 0.0);
    EXPECT_DOUBLE_EQ(bodies.position(a).x, 1.0);
}
