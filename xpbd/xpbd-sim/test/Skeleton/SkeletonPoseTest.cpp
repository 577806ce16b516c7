// Ticket: 0001_skeleton_node_store

#include <gtest/gtest.h>
#include <Eigen/Geometry>
#include <set>
#include <string_view>

#include "xpbd-sim/src/Skeleton/Landmark.hpp"
#include "xpbd-sim/src/Skeleton/SkeletonPose.hpp"

using namespace xpbd_sim;

// ============================================================================
// Landmark
// ============================================================================

TEST(LandmarkTest, CardinalityAndOrder)
{
  EXPECT_EQ(kLandmarkCount, 25u);
  for (size_t i = 0; i < kAllLandmarks.size(); ++i)
  {
    EXPECT_EQ(landmarkIndex(kAllLandmarks[i]), i);
  }
  EXPECT_EQ(kAllLandmarks.front(), Landmark::Hmd);
  EXPECT_EQ(kAllLandmarks.back(), Landmark::RightFoot);
}

TEST(LandmarkTest, NamesAreUnique)
{
  std::set<std::string_view> names;
  for (Landmark const landmark : kAllLandmarks)
  {
    EXPECT_FALSE(landmarkName(landmark).empty());
    names.insert(landmarkName(landmark));
  }
  EXPECT_EQ(names.size(), kLandmarkCount);
  EXPECT_EQ(landmarkName(Landmark::BalancePoint), "BalancePoint");
  EXPECT_EQ(landmarkName(Landmark::RightLowerLeg), "RightLowerLeg");
}

// ============================================================================
// SkeletonPose
// ============================================================================

TEST(SkeletonPoseTest, DefaultIsOriginAndIdentity)
{
  SkeletonPose const pose;
  for (Landmark const landmark : kAllLandmarks)
  {
    EXPECT_DOUBLE_EQ(pose.position(landmark).norm(), 0.0);
    EXPECT_TRUE(
      pose.orientation(landmark).isApprox(Eigen::Quaterniond::Identity()));
  }
  EXPECT_DOUBLE_EQ(pose.maxOrientationNormError(), 0.0);
}

TEST(SkeletonPoseTest, SetOrientationNormalizes)
{
  SkeletonPose pose;
  pose.setOrientation(Landmark::Torso, Eigen::Quaterniond{0.0, 0.0, 4.0, 0.0});

  EXPECT_NEAR(pose.orientation(Landmark::Torso).norm(), 1.0, 1e-15);
  EXPECT_LT(pose.maxOrientationNormError(), 1e-15);
}

TEST(SkeletonPoseTest, TransformRoundTrip)
{
  SkeletonPose pose;
  Eigen::Quaterniond const q{
    Eigen::AngleAxisd{0.4, Eigen::Vector3d::UnitX()}};
  ReferenceFrame const frame{Coordinate{0.1, 0.9, -0.3}, q};

  pose.setTransform(Landmark::LeftFoot, frame);
  ReferenceFrame const readBack = pose.transform(Landmark::LeftFoot);

  EXPECT_TRUE(readBack.getOrigin().isApprox(frame.getOrigin()));
  EXPECT_TRUE(readBack.getOrientation().isApprox(q));
  // Other landmarks untouched
  EXPECT_DOUBLE_EQ(pose.position(Landmark::RightFoot).norm(), 0.0);
}

TEST(SkeletonPoseTest, NormErrorDetectsRawWrite)
{
  SkeletonPose pose;
  pose.orientation(Landmark::Pelvis) = Eigen::Quaterniond{1.5, 0.0, 0.0, 0.0};

  EXPECT_NEAR(pose.maxOrientationNormError(), 0.5, 1e-15);
}
