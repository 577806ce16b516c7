#include <gtest/gtest.h>
#include <Eigen/Geometry>
#include <cmath>
#include <numbers>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Environment/ReferenceFrame.hpp"
#include "xpbd-sim/src/Utils/utils.hpp"

using namespace xpbd_sim;

namespace
{

bool coordinatesEqual(const Coordinate& c1,
                      const Coordinate& c2,
                      double tolerance = 1e-12)
{
  return almostEqual(c1.x(), c2.x(), tolerance) &&
         almostEqual(c1.y(), c2.y(), tolerance) &&
         almostEqual(c1.z(), c2.z(), tolerance);
}

Eigen::Quaterniond yawQuarterTurn()
{
  return Eigen::Quaterniond{
    Eigen::AngleAxisd{std::numbers::pi / 2.0, Eigen::Vector3d::UnitY()}};
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(ReferenceFrameTest, DefaultConstructor)
{
  ReferenceFrame const frame;

  EXPECT_DOUBLE_EQ(frame.getOrigin().norm(), 0.0);
  EXPECT_TRUE(frame.getOrientation().isApprox(Eigen::Quaterniond::Identity()));
}

TEST(ReferenceFrameTest, OrientationNormalizedOnEntry)
{
  ReferenceFrame frame{Coordinate{1.0, 2.0, 3.0},
                       Eigen::Quaterniond{2.0, 0.0, 0.0, 0.0}};
  EXPECT_NEAR(frame.getOrientation().norm(), 1.0, 1e-15);

  frame.setOrientation(Eigen::Quaterniond{0.0, 0.0, 3.0, 0.0});
  EXPECT_NEAR(frame.getOrientation().norm(), 1.0, 1e-15);
}

// ============================================================================
// Point and vector transforms
// ============================================================================

TEST(ReferenceFrameTest, LocalToGlobal_RotationThenTranslation)
{
  ReferenceFrame const frame{Coordinate{1.0, 2.0, 3.0}, yawQuarterTurn()};

  // +90 deg about Y maps local +X onto parent -Z
  Coordinate const global = frame.localToGlobal(Coordinate{1.0, 0.0, 0.0});
  EXPECT_TRUE(coordinatesEqual(global, Coordinate{1.0, 2.0, 2.0}));
}

TEST(ReferenceFrameTest, GlobalToLocal_InvertsLocalToGlobal)
{
  ReferenceFrame const frame{Coordinate{-0.5, 1.5, 2.0}, yawQuarterTurn()};
  Coordinate const local{0.3, -0.2, 0.7};

  EXPECT_TRUE(
    coordinatesEqual(frame.globalToLocal(frame.localToGlobal(local)), local));
}

TEST(ReferenceFrameTest, RelativeTransformsIgnoreOrigin)
{
  ReferenceFrame const frame{Coordinate{10.0, 10.0, 10.0}, yawQuarterTurn()};

  Coordinate const rotated =
    frame.localToGlobalRelative(Coordinate{0.0, 0.0, -1.0});
  EXPECT_TRUE(coordinatesEqual(rotated, Coordinate{-1.0, 0.0, 0.0}));
  EXPECT_TRUE(coordinatesEqual(frame.globalToLocalRelative(rotated),
                               Coordinate{0.0, 0.0, -1.0}));
}

TEST(ReferenceFrameTest, AxesAreRotationColumns)
{
  ReferenceFrame const frame{Coordinate{0.0, 0.0, 0.0}, yawQuarterTurn()};

  EXPECT_TRUE(coordinatesEqual(frame.xAxis(), Coordinate{0.0, 0.0, -1.0}));
  EXPECT_TRUE(coordinatesEqual(frame.yAxis(), Coordinate{0.0, 1.0, 0.0}));
  EXPECT_TRUE(coordinatesEqual(frame.zAxis(), Coordinate{1.0, 0.0, 0.0}));
  EXPECT_TRUE(frame.getRotation().col(0).isApprox(frame.xAxis()));
}

// ============================================================================
// Composition
// ============================================================================

TEST(ReferenceFrameTest, Translated_OffsetInLocalAxes)
{
  ReferenceFrame const hmd{Coordinate{0.0, 1.6, 0.0}, yawQuarterTurn()};

  // Local +Z (behind the headset) rotates onto parent +X
  ReferenceFrame const headCenter = hmd.translated(Coordinate{0.0, 0.0, 0.1});
  EXPECT_TRUE(
    coordinatesEqual(headCenter.getOrigin(), Coordinate{0.1, 1.6, 0.0}));
  EXPECT_TRUE(headCenter.getOrientation().isApprox(hmd.getOrientation()));
}

TEST(ReferenceFrameTest, Compose_ChainsRotationAndTranslation)
{
  ReferenceFrame const parent{Coordinate{1.0, 0.0, 0.0}, yawQuarterTurn()};
  ReferenceFrame const child{Coordinate{0.0, 0.0, 1.0}, yawQuarterTurn()};

  ReferenceFrame const composed = parent.compose(child);

  EXPECT_TRUE(coordinatesEqual(composed.getOrigin(), Coordinate{2.0, 0.0, 0.0}));
  // Two quarter turns about Y: local +X ends up on parent -X
  EXPECT_TRUE(coordinatesEqual(composed.xAxis(), Coordinate{-1.0, 0.0, 0.0}));
}

TEST(ReferenceFrameTest, Inverse_ComposesToIdentity)
{
  ReferenceFrame const frame{
    Coordinate{0.4, -1.0, 2.5},
    Eigen::Quaterniond{Eigen::AngleAxisd{
      0.7, Eigen::Vector3d{1.0, 2.0, -0.5}.normalized()}}};

  ReferenceFrame const identity = frame.compose(frame.inverse());

  EXPECT_TRUE(coordinatesEqual(identity.getOrigin(), Coordinate{0.0, 0.0, 0.0}));
  EXPECT_NEAR(
    std::abs(identity.getOrientation().dot(Eigen::Quaterniond::Identity())),
    1.0,
    1e-12);
}

TEST(ReferenceFrameTest, Relative_MatchesInverseCompose)
{
  ReferenceFrame const base{Coordinate{1.0, 0.0, -2.0}, yawQuarterTurn()};
  ReferenceFrame const foot{Coordinate{1.0, 0.0, -2.2}};

  ReferenceFrame const viaRelative = base.relative(foot);
  ReferenceFrame const viaInverse = base.inverse().compose(foot);

  EXPECT_TRUE(
    coordinatesEqual(viaRelative.getOrigin(), viaInverse.getOrigin()));
  EXPECT_TRUE(
    viaRelative.getOrientation().isApprox(viaInverse.getOrientation()));
  // Base +X points along parent -Z, so the foot sits 0.2 m along base +X
  EXPECT_TRUE(
    coordinatesEqual(viaRelative.getOrigin(), Coordinate{0.2, 0.0, 0.0}));
}
