#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

#include "gravsim/core/body_registry.hpp"
#include "gravsim/core/constants.hpp"

class BodyRegistryTest : public ::testing::Test {
protected:
    BodyRegistry bodies;

    entt::entity createBody(double x, double y, double z, double radius) {
        return bodies.createBody(Position(x, y, z), Vector(), radius);
    }
};

TEST_F(BodyRegistryTest, MassIsDerivedFromRadius) {
    auto e = createBody(0.0, 0.0, 0.0, 1.0);
    EXPECT_NEAR(bodies.mass(e), 4.18879, 1e-5);
    EXPECT_DOUBLE_EQ(bodies.radius(e), 1.0);

    auto small = createBody(5.0, 0.0, 0.0, 0.5);
    EXPECT_NEAR(bodies.mass(small), 4.0 / 3.0 * SimulatorConstants::Pi * 0.125, 1e-12);
}

TEST_F(BodyRegistryTest, RejectsInvalidRadius) {
    EXPECT_THROW(createBody(0.0, 0.0, 0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(createBody(0.0, 0.0, 0.0, -1.0), std::invalid_argument);
    EXPECT_THROW(createBody(0.0, 0.0, 0.0, std::nan("")), std::invalid_argument);
    EXPECT_THROW(createBody(0.0, 0.0, 0.0, std::numeric_limits<double>::infinity()),
                 std::invalid_argument);

    // Nothing entered the registry
    EXPECT_TRUE(bodies.empty());
    EXPECT_TRUE(bodies.getRegistry().view<Components::Position>().empty());
}

TEST_F(BodyRegistryTest, RejectsRadiusWhoseMassUnderflows) {
    EXPECT_THROW(createBody(0.0, 0.0, 0.0, 1e-120), std::invalid_argument);
    EXPECT_EQ(bodies.size(), 0u);
}

TEST_F(BodyRegistryTest, RejectsNonFiniteState) {
    EXPECT_THROW(createBody(std::nan(""), 0.0, 0.0, 1.0), std::invalid_argument);
    EXPECT_THROW(bodies.createBody(Position(), Vector(0.0, std::numeric_limits<double>::infinity(), 0.0), 1.0),
                 std::invalid_argument);
    EXPECT_TRUE(bodies.empty());
}

TEST_F(BodyRegistryTest, IndexAndHandleAgree) {
    auto a = createBody(1.0, 0.0, 0.0, 1.0);
    auto b = createBody(2.0, 0.0, 0.0, 1.0);
    auto c = createBody(3.0, 0.0, 0.0, 1.0);

    EXPECT_EQ(bodies.size(), 3u);
    EXPECT_EQ(bodies.entity(0), a);
    EXPECT_EQ(bodies.entity(1), b);
    EXPECT_EQ(bodies.entity(2), c);
    EXPECT_EQ(bodies.indexOf(c), std::optional<std::size_t>(2));
    EXPECT_DOUBLE_EQ(bodies.position(std::size_t{1}).x, 2.0);
    EXPECT_THROW(bodies.entity(3), std::out_of_range);
}

TEST_F(BodyRegistryTest, ContainsRejectsUnknownHandles) {
    auto a = createBody(0.0, 0.0, 0.0, 1.0);
    EXPECT_TRUE(bodies.contains(a));
    EXPECT_FALSE(bodies.contains(entt::entity{42}));
    EXPECT_FALSE(bodies.contains(entt::null));
    EXPECT_FALSE(bodies.indexOf(entt::entity{42}).has_value());
}

TEST_F(BodyRegistryTest, ForEachBodyVisitsInCreationOrder) {
    for (int i = 0; i < 5; ++i) {
        createBody(static_cast<double>(i), 0.0, 0.0, 0.1);
    }

    std::vector<std::size_t> seen;
    bodies.forEachBody([&](std::size_t i, entt::entity e) {
        EXPECT_EQ(bodies.entity(i), e);
        EXPECT_DOUBLE_EQ(bodies.position(e).x, static_cast<double>(i));
        seen.push_back(i);
    });
    EXPECT_EQ(seen, (std::vector<std::size_t>{0, 1, 2, 3, 4}));
}

TEST_F(BodyRegistryTest, ForEachPairVisitsEveryUnorderedPairOnce) {
    const std::size_t n = 7;
    for (std::size_t i = 0; i < n; ++i) {
        createBody(static_cast<double>(i), 0.0, 0.0, 0.1);
    }

    std::set<std::pair<std::size_t, std::size_t>> pairs;
    std::size_t visits = 0;
    bodies.forEachPair([&](std::size_t i, std::size_t j) {
        EXPECT_LT(i, j);
        pairs.insert({i, j});
        ++visits;
    });

    EXPECT_EQ(visits, n * (n - 1) / 2);
    EXPECT_EQ(pairs.size(), visits);
    EXPECT_EQ(bodies.pairCount(), visits);
}

TEST_F(BodyRegistryTest, ForEachPairOrderIsRowMajor) {
    for (int i = 0; i < 4; ++i) {
        createBody(static_cast<double>(i), 0.0, 0.0, 0.1);
    }

    std::vector<std::pair<std::size_t, std::size_t>> order;
    bodies.forEachPair([&](std::size_t i, std::size_t j) { order.emplace_back(i, j); });

    std::vector<std::pair<std::size_t, std::size_t>> expected{
        {0, 1}, {0, 2}, {0, 3}, {1, 2}, {1, 3}, {2, 3}};
    EXPECT_EQ(order, expected);
}

TEST_F(BodyRegistryTest, NoPairsForFewerThanTwoBodies) {
    std::size_t visits = 0;
    bodies.forEachPair([&](std::size_t, std::size_t) { ++visits; });
    EXPECT_EQ(visits, 0u);

    createBody(0.0, 0.0, 0.0, 1.0);
    bodies.forEachPair([&](std::size_t, std::size_t) { ++visits; });
    EXPECT_EQ(visits, 0u);
    EXPECT_EQ(bodies.pairCount(), 0u);
}

TEST_F(BodyRegistryTest, MomentumAndKineticEnergy) {
    auto a = bodies.createBody(Position(), Vector(1.0, 0.0, 0.0), 1.0);
    auto b = bodies.createBody(Position(5.0, 0.0, 0.0), Vector(0.0, -2.0, 0.0), 1.0);
    double const m = bodies.mass(a);
    ASSERT_DOUBLE_EQ(m, bodies.mass(b));

    Vector p = bodies.totalMomentum();
    EXPECT_DOUBLE_EQ(p.x, m);
    EXPECT_DOUBLE_EQ(p.y, -2.0 * m);
    EXPECT_DOUBLE_EQ(p.z, 0.0);
    EXPECT_DOUBLE_EQ(bodies.totalKineticEnergy(), 0.5 * m * 1.0 + 0.5 * m * 4.0);
}

TEST_F(BodyRegistryTest, DetectsNonFiniteState) {
    auto a = createBody(0.0, 0.0, 0.0, 1.0);
    EXPECT_FALSE(bodies.hasNonFiniteState());
    bodies.velocity(a).x = std::nan("");
    EXPECT_TRUE(bodies.hasNonFiniteState());
}

TEST_F(BodyRegistryTest, ClearEmptiesRegistry) {
    auto a = createBody(0.0, 0.0, 0.0, 1.0);
    createBody(3.0, 0.0, 0.0, 1.0);
    bodies.clear();
    EXPECT_TRUE(bodies.empty());
    EXPECT_FALSE(bodies.contains(a));
}
