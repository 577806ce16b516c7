// Ticket: 0005_humanoid_anatomy

#include <gtest/gtest.h>
#include <array>
#include <stdexcept>
#include <utility>

#include "xpbd-sim/src/Rig/HumanoidConstraintFactory.hpp"

using namespace xpbd_sim;

TEST(HumanoidConstraintFactoryTest, SolveOrder)
{
  ConstraintSet const set = HumanoidConstraintFactory::build(TuningParameters{});

  using Pair = std::pair<Landmark, Landmark>;
  std::array<Pair, 12> const expectedSpherical{
    Pair{Landmark::LeftPalm, Landmark::LeftLowerArm},
    Pair{Landmark::RightPalm, Landmark::RightLowerArm},
    Pair{Landmark::LeftLowerArm, Landmark::LeftUpperArm},
    Pair{Landmark::RightLowerArm, Landmark::RightUpperArm},
    Pair{Landmark::HeadCenter, Landmark::Torso},
    Pair{Landmark::Torso, Landmark::Pelvis},
    Pair{Landmark::Pelvis, Landmark::LeftUpperLeg},
    Pair{Landmark::Pelvis, Landmark::RightUpperLeg},
    Pair{Landmark::LeftUpperLeg, Landmark::LeftLowerLeg},
    Pair{Landmark::RightUpperLeg, Landmark::RightLowerLeg},
    Pair{Landmark::LeftLowerLeg, Landmark::LeftFoot},
    Pair{Landmark::RightLowerLeg, Landmark::RightFoot}};

  ASSERT_EQ(set.spherical.size(), expectedSpherical.size());
  for (size_t i = 0; i < expectedSpherical.size(); ++i)
  {
    EXPECT_EQ(set.spherical[i].nodeA(), expectedSpherical[i].first) << i;
    EXPECT_EQ(set.spherical[i].nodeB(), expectedSpherical[i].second) << i;
  }

  ASSERT_EQ(set.distance.size(), 2u);
  EXPECT_EQ(set.distance[0].nodeA(), Landmark::LeftUpperArm);
  EXPECT_EQ(set.distance[1].nodeA(), Landmark::RightUpperArm);
  EXPECT_EQ(set.distance[0].nodeB(), Landmark::Torso);
  EXPECT_EQ(set.distance[1].nodeB(), Landmark::Torso);
}

TEST(HumanoidConstraintFactoryTest, AttachmentPointsFromDefaults)
{
  ConstraintSet const set = HumanoidConstraintFactory::build(TuningParameters{});

  // Wrists mirror the lateral palm offset
  EXPECT_DOUBLE_EQ(set.spherical[0].pointInA().x(), -0.015);
  EXPECT_DOUBLE_EQ(set.spherical[1].pointInA().x(), 0.015);
  EXPECT_DOUBLE_EQ(set.spherical[0].pointInA().z(), 0.065);
  EXPECT_DOUBLE_EQ(set.spherical[0].pointInB().z(), -0.14);

  // Elbow
  EXPECT_DOUBLE_EQ(set.spherical[2].pointInA().z(), 0.14);
  EXPECT_DOUBLE_EQ(set.spherical[2].pointInB().z(), -0.14);

  // Neck and lower back
  EXPECT_DOUBLE_EQ(set.spherical[4].pointInA().y(), -0.10);
  EXPECT_DOUBLE_EQ(set.spherical[4].pointInB().y(), 0.22);
  EXPECT_DOUBLE_EQ(set.spherical[5].pointInA().y(), -0.20);
  EXPECT_DOUBLE_EQ(set.spherical[5].pointInB().y(), 0.10);

  // Hips sit half the hip width either side
  EXPECT_DOUBLE_EQ(set.spherical[6].pointInA().x(), -0.13);
  EXPECT_DOUBLE_EQ(set.spherical[7].pointInA().x(), 0.13);
  EXPECT_DOUBLE_EQ(set.spherical[6].pointInA().y(), -0.07);

  // Ankle
  EXPECT_DOUBLE_EQ(set.spherical[10].pointInA().y(), -0.20);
  EXPECT_DOUBLE_EQ(set.spherical[10].pointInB().y(), 0.10);

  // Collarbones from the sternoclavicular joints
  EXPECT_DOUBLE_EQ(set.distance[0].pointInB().x(), -0.03);
  EXPECT_DOUBLE_EQ(set.distance[1].pointInB().x(), 0.03);
  EXPECT_DOUBLE_EQ(set.distance[0].pointInB().y(), 0.20);
  EXPECT_DOUBLE_EQ(set.distance[0].pointInA().z(), 0.14);
  EXPECT_DOUBLE_EQ(set.distance[0].getRestDistance(), 0.17);
}

TEST(HumanoidConstraintFactoryTest, DimensionsFollowParameters)
{
  TuningParameters params;
  params.set("lower_arm_length", 0.30);
  params.set("collarbone_length", 0.19);
  params.set("upper_leg_length", 0.50);

  ConstraintSet const set = HumanoidConstraintFactory::build(params);

  EXPECT_DOUBLE_EQ(set.spherical[0].pointInB().z(), -0.15);
  EXPECT_DOUBLE_EQ(set.spherical[6].pointInB().y(), 0.25);
  EXPECT_DOUBLE_EQ(set.spherical[8].pointInA().y(), -0.25);
  EXPECT_DOUBLE_EQ(set.distance[1].getRestDistance(), 0.19);
}

TEST(HumanoidConstraintFactoryTest, NegativeCollarboneThrows)
{
  TuningParameters params;
  params.collarboneLength = -0.1;
  EXPECT_THROW((void)HumanoidConstraintFactory::build(params),
               std::invalid_argument);
}
