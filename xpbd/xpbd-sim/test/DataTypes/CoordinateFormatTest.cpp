#include <gtest/gtest.h>
#include <format>
#include <string>

#include "xpbd-sim/src/DataTypes/Acceleration.hpp"
#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Velocity.hpp"

using namespace xpbd_sim;

TEST(CoordinateFormatTest, DefaultFormatting)
{
  Coordinate const c{1.0, -2.5, 0.0};
  EXPECT_EQ(std::format("{}", c), "(1, -2.5, 0)");
}

TEST(CoordinateFormatTest, PrecisionAppliesPerComponent)
{
  Velocity const v{0.12345, 1.0, -3.0};
  EXPECT_EQ(std::format("{:.2f}", v), "(0.12, 1.00, -3.00)");
}

TEST(CoordinateFormatTest, ExpressionAssignmentKeepsSemanticType)
{
  Coordinate const x{1.0, 2.0, 3.0};
  Velocity const v{0.5, 0.0, -1.0};
  Acceleration const a{0.0, -10.0, 0.0};

  Coordinate const next = x + v * 2.0;
  Velocity const dv = a * 0.1;

  EXPECT_EQ(std::format("{}", next), "(2, 2, 1)");
  EXPECT_EQ(std::format("{}", dv), "(0, -1, 0)");
}

TEST(CoordinateFormatTest, HorizontalDropsVerticalComponent)
{
  Coordinate const c{0.3, 1.7, -2.0};
  Coordinate const ground = c.horizontal();

  EXPECT_DOUBLE_EQ(ground.x(), 0.3);
  EXPECT_DOUBLE_EQ(ground.y(), 0.0);
  EXPECT_DOUBLE_EQ(ground.z(), -2.0);
  EXPECT_DOUBLE_EQ(c.y(), 1.7);
}
