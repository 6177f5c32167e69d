#include <gtest/gtest.h>

#include "dynamics/state_layout.hpp"
#include "common/errors.hpp"

#include <Eigen/Dense>

#include <stdexcept>
#include <vector>

using namespace dynamics;

TEST(StateLayoutTest, InterleavesPositionAndMomentumPerBody) {
    StateLayout layout(3);

    EXPECT_EQ(layout.dimension(), 12);
    EXPECT_EQ(layout.offset(0, Component::X), 0);
    EXPECT_EQ(layout.offset(0, Component::PX), 1);
    EXPECT_EQ(layout.offset(0, Component::Y), 2);
    EXPECT_EQ(layout.offset(0, Component::PY), 3);
    EXPECT_EQ(layout.offset(1, Component::X), 4);
    EXPECT_EQ(layout.offset(2, Component::PY), 11);
}

TEST(StateLayoutTest, LocateInvertsOffset) {
    StateLayout layout(4);

    for (Eigen::Index i = 0; i < layout.dimension(); ++i) {
        auto located = layout.locate(i);
        EXPECT_EQ(layout.offset(located.first, located.second), i);
    }
    EXPECT_EQ(layout.locate(6).first, 1u);
    EXPECT_EQ(layout.locate(6).second, Component::Y);
}

TEST(StateLayoutTest, PackAndUnpack) {
    StateLayout layout(2);
    std::vector<BodyState> bodies = {
        {Eigen::Vector2d(20.0, 20.0), Eigen::Vector2d(-2.0, 2.0)},
        {Eigen::Vector2d(-20.0, -20.0), Eigen::Vector2d(0.0, 0.0)}
    };

    Eigen::VectorXd state = layout.pack(bodies);

    Eigen::VectorXd expected(8);
    expected << 20.0, -2.0, 20.0, 2.0, -20.0, 0.0, -20.0, 0.0;
    EXPECT_EQ(state, expected);

    auto unpacked = layout.unpack(state);
    ASSERT_EQ(unpacked.size(), 2u);
    EXPECT_EQ(unpacked[0].position, bodies[0].position);
    EXPECT_EQ(unpacked[0].momentum, bodies[0].momentum);
    EXPECT_EQ(unpacked[1].position, bodies[1].position);
    EXPECT_EQ(unpacked[1].momentum, bodies[1].momentum);
}

TEST(StateLayoutTest, PositionAndMomentumAccessors) {
    StateLayout layout(2);
    Eigen::VectorXd state(8);
    state << 1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0;

    EXPECT_EQ(layout.position(state, 1), Eigen::Vector2d(5.0, 7.0));
    EXPECT_EQ(layout.momentum(state, 1), Eigen::Vector2d(6.0, 8.0));
}

TEST(StateLayoutTest, RejectsEmptyLayout) {
    EXPECT_THROW(StateLayout(0), common::ConfigurationError);
}

TEST(StateLayoutTest, RejectsMismatchedSizes) {
    StateLayout layout(2);
    std::vector<BodyState> one_body(1);

    EXPECT_THROW(layout.pack(one_body), common::ConfigurationError);
    EXPECT_THROW(layout.unpack(Eigen::VectorXd::Zero(6)), common::ConfigurationError);
    EXPECT_THROW(layout.position(Eigen::VectorXd::Zero(4), 0), common::ConfigurationError);
}

TEST(StateLayoutTest, RejectsOutOfRangeIndices) {
    StateLayout layout(2);

    EXPECT_THROW(layout.offset(2, Component::X), std::out_of_range);
    EXPECT_THROW(layout.locate(8), std::out_of_range);
    EXPECT_THROW(layout.locate(-1), std::out_of_range);
}
