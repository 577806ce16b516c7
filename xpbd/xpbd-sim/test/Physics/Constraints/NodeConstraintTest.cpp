// Ticket: 0002_constraint_primitives

#include <gtest/gtest.h>
#include <Eigen/Geometry>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

#include "xpbd-sim/src/Physics/Constraints/ConstraintSet.hpp"
#include "xpbd-sim/src/Physics/Constraints/DistanceConstraint.hpp"
#include "xpbd-sim/src/Physics/Constraints/SphericalConstraint.hpp"
#include "xpbd-sim/src/Skeleton/SkeletonPose.hpp"

using namespace xpbd_sim;

// ============================================================================
// SphericalConstraint
// ============================================================================

TEST(SphericalConstraintTest, EvaluateIsAttachmentDifference)
{
  SkeletonPose pose;
  pose.setPosition(Landmark::Torso, Coordinate{0.0, 0.0, 3.0});

  SphericalConstraint const joint{Landmark::Pelvis,
                                  Landmark::Torso,
                                  Coordinate{0.0, 0.0, 1.0},
                                  Coordinate{0.0, 0.0, -1.0}};

  Coordinate const c = joint.evaluate(pose);
  EXPECT_NEAR(c.x(), 0.0, 1e-15);
  EXPECT_NEAR(c.y(), 0.0, 1e-15);
  EXPECT_NEAR(c.z(), -1.0, 1e-15);
}

TEST(SphericalConstraintTest, LeverArmFollowsBodyRotation)
{
  SkeletonPose pose;
  pose.setOrientation(
    Landmark::LeftUpperArm,
    Eigen::Quaterniond{
      Eigen::AngleAxisd{std::numbers::pi / 2.0, Eigen::Vector3d::UnitY()}});

  SphericalConstraint const joint{Landmark::LeftUpperArm,
                                  Landmark::LeftLowerArm,
                                  Coordinate{0.0, 0.0, 1.0},
                                  Coordinate{0.0, 0.0, 0.0}};

  Coordinate const rA = joint.leverArmA(pose);
  EXPECT_NEAR(rA.x(), 1.0, 1e-12);
  EXPECT_NEAR(rA.z(), 0.0, 1e-12);
  EXPECT_TRUE(joint.worldAttachmentA(pose).isApprox(rA));
}

TEST(SphericalConstraintTest, AccessorsReturnConstructionValues)
{
  SphericalConstraint const joint{Landmark::LeftLowerLeg,
                                  Landmark::LeftFoot,
                                  Coordinate{0.0, -0.2, 0.0},
                                  Coordinate{0.0, 0.1, 0.0}};

  EXPECT_EQ(joint.nodeA(), Landmark::LeftLowerLeg);
  EXPECT_EQ(joint.nodeB(), Landmark::LeftFoot);
  EXPECT_DOUBLE_EQ(joint.pointInA().y(), -0.2);
  EXPECT_DOUBLE_EQ(joint.pointInB().y(), 0.1);
}

// ============================================================================
// DistanceConstraint
// ============================================================================

TEST(DistanceConstraintTest, EvaluateIsSeparationMinusRest)
{
  SkeletonPose pose;
  pose.setPosition(Landmark::LeftUpperArm, Coordinate{2.0, 0.0, 0.0});

  DistanceConstraint const collarbone{Landmark::LeftUpperArm,
                                      Landmark::Torso,
                                      Coordinate{0.0, 0.0, 0.0},
                                      Coordinate{0.0, 0.0, 0.0},
                                      1.5};

  EXPECT_NEAR(collarbone.evaluate(pose), 0.5, 1e-15);
  EXPECT_DOUBLE_EQ(collarbone.getRestDistance(), 1.5);
}

TEST(DistanceConstraintTest, ZeroRestDistanceAllowed)
{
  EXPECT_NO_THROW((DistanceConstraint{Landmark::Torso,
                                      Landmark::Pelvis,
                                      Coordinate{0.0, 0.0, 0.0},
                                      Coordinate{0.0, 0.0, 0.0},
                                      0.0}));
}

TEST(DistanceConstraintTest, InvalidRestDistanceThrows)
{
  Coordinate const zero{0.0, 0.0, 0.0};

  EXPECT_THROW(
    (DistanceConstraint{Landmark::Torso, Landmark::Pelvis, zero, zero, -0.1}),
    std::invalid_argument);
  EXPECT_THROW((DistanceConstraint{Landmark::Torso,
                                   Landmark::Pelvis,
                                   zero,
                                   zero,
                                   std::numeric_limits<double>::quiet_NaN()}),
               std::invalid_argument);
  EXPECT_THROW((DistanceConstraint{Landmark::Torso,
                                   Landmark::Pelvis,
                                   zero,
                                   zero,
                                   std::numeric_limits<double>::infinity()}),
               std::invalid_argument);
}

// ============================================================================
// ConstraintSet
// ============================================================================

TEST(ConstraintSetTest, MaxErrorsOverEachList)
{
  SkeletonPose pose;
  pose.setPosition(Landmark::Pelvis, Coordinate{0.0, -0.3, 0.0});
  pose.setPosition(Landmark::LeftUpperArm, Coordinate{0.0, 0.0, 0.4});

  Coordinate const zero{0.0, 0.0, 0.0};
  ConstraintSet set;
  set.spherical.emplace_back(Landmark::Torso, Landmark::Pelvis, zero, zero);
  set.spherical.emplace_back(
    Landmark::Torso, Landmark::Hmd, zero, Coordinate{0.1, 0.0, 0.0});
  set.distance.emplace_back(
    Landmark::LeftUpperArm, Landmark::Torso, zero, zero, 0.1);

  EXPECT_EQ(set.size(), 3u);
  EXPECT_NEAR(set.maxSphericalError(pose), 0.3, 1e-15);
  EXPECT_NEAR(set.maxDistanceError(pose), 0.3, 1e-15);
}

TEST(ConstraintSetTest, EmptySetHasNoError)
{
  ConstraintSet const set;
  SkeletonPose const pose;

  EXPECT_EQ(set.size(), 0u);
  EXPECT_DOUBLE_EQ(set.maxSphericalError(pose), 0.0);
  EXPECT_DOUBLE_EQ(set.maxDistanceError(pose), 0.0);
}
